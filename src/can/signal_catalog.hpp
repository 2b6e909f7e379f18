// src/can/signal_catalog.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace YAML {
class Node;
}

namespace can {

enum class ByteOrder {
    Big,    // Motorola: byte[start] is most significant
    Little  // Intel: byte[start] is least significant
};

// One scalar signal inside a CAN frame, byte aligned
struct SignalDefinition {
    uint32_t frame_id = 0;
    std::string signal_name;

    int start_byte = 0;     // 0..7
    int length_bytes = 1;   // 1..8, start_byte + length_bytes <= 8

    double scale = 1.0;
    double offset = 0.0;
    bool is_signed = false;
    ByteOrder byte_order = ByteOrder::Big;
};

/**
 * SignalCatalog - frame_id -> signals to decode from that frame
 *
 * Built once from the `can.message_definitions` YAML sequence:
 *
 *   - id: "0x123"
 *     name: EngineRPM
 *     parser:
 *       type: scalar          # "simple_scalar" accepted as well
 *       start_byte: 0
 *       length_bytes: 2
 *       scale: 0.25
 *       offset: 0
 *       is_signed: false
 *       byte_order: big       # big | little
 *
 * A malformed record is skipped with a warning and never aborts the build.
 * Signals sharing a frame_id keep their order of appearance.
 */
class SignalCatalog {
public:
    static SignalCatalog build(const YAML::Node& raw_definitions);

    // nullptr if no signal is defined for this id
    const std::vector<SignalDefinition>* find(uint32_t frame_id) const;

    // Adds an already validated definition (tools and tests)
    bool add(const SignalDefinition& def);

    bool empty() const { return frames_.empty(); }
    size_t frame_count() const { return frames_.size(); }
    size_t signal_count() const { return signal_count_; }

    const std::unordered_map<uint32_t, std::vector<SignalDefinition>>& frames() const {
        return frames_;
    }

private:
    std::unordered_map<uint32_t, std::vector<SignalDefinition>> frames_;
    size_t signal_count_ = 0;
};

// Range check shared by build() and add()
bool is_valid_layout(int start_byte, int length_bytes);

} // namespace can
