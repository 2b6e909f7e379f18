// src/telemetry/collaborators.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "telemetry/snapshot.hpp"

namespace telemetry {

// Everything here is called from the aggregator thread only.

class PositionSource {
public:
    virtual ~PositionSource() = default;
    virtual bool is_connected() const = 0;
    virtual std::optional<GpsFix> get_position() = 0;
    virtual void close() = 0;
};

class DiagnosticSource {
public:
    virtual ~DiagnosticSource() = default;
    virtual bool is_connected() const = 0;
    virtual DiagnosticReading read() = 0;
    virtual void close() = 0;
};

/**
 * Low-bandwidth radio mesh. Payloads are size limited; send() returns
 * false for anything that does not fit.
 */
class MeshSink {
public:
    virtual ~MeshSink() = default;
    virtual bool is_connected() const = 0;
    virtual bool send(const Snapshot& snapshot) = 0;
    virtual void close() = 0;

    // Node identity used as device id when configured so
    virtual std::optional<std::string> node_id() const { return std::nullopt; }
};

class MessageBusSink {
public:
    virtual ~MessageBusSink() = default;
    virtual bool is_connected() const = 0;
    virtual bool publish(const Snapshot& snapshot, const std::string& sub_topic) = 0;
    virtual void close() = 0;
};

class TrackingSink {
public:
    virtual ~TrackingSink() = default;
    virtual bool is_configured() const = 0;
    virtual bool send(const Snapshot& snapshot) = 0;
    virtual void close() = 0;
};

// Absent members are simply skipped
struct Collaborators {
    std::shared_ptr<PositionSource> position;
    std::shared_ptr<DiagnosticSource> diagnostic;
    std::shared_ptr<MeshSink> mesh;
    std::shared_ptr<MessageBusSink> message_bus;
    std::shared_ptr<TrackingSink> tracking;
};

} // namespace telemetry
