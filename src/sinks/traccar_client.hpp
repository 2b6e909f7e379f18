// src/sinks/traccar_client.hpp
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "telemetry/collaborators.hpp"

namespace sinks {

/**
 * Traccar client speaking the OsmAnd HTTP protocol.
 *
 * Every send is one POST to http://host:port/path?id=...&lat=...&lon=...
 * Diagnostic sensors are added under their cleaned names, bus signals as
 * can_<cleaned name>, fault codes comma-joined under "dtcs".
 *
 * Rate limiting is the caller's job (Aggregator owns the RateLimiter).
 */
class TraccarClient : public telemetry::TrackingSink {
public:
    struct Config {
        bool enabled = false;
        std::string host = "localhost";
        int port = 5055;
        bool use_http = true;
        std::string http_path = "/";
        double request_timeout_s = 10.0;
        bool convert_speed_to_knots = true;
    };

    using Params = std::vector<std::pair<std::string, std::string>>;

    /**
     * @param tracking_id  device identifier registered on the Traccar server
     * @throws std::runtime_error if libcurl cannot be initialised
     */
    TraccarClient(const Config& config, std::string tracking_id);
    ~TraccarClient() override;

    TraccarClient(const TraccarClient&) = delete;
    TraccarClient& operator=(const TraccarClient&) = delete;

    bool is_configured() const override { return configured_; }

    // false without lat/lon, when unconfigured, or on any non-2xx answer
    bool send(const telemetry::Snapshot& snapshot) override;

    void close() override;

    // OsmAnd query parameters in send order (unescaped)
    Params build_params(const telemetry::Snapshot& snapshot) const;

    // base_url + "?" + escaped query
    std::string build_request_url(const telemetry::Snapshot& snapshot) const;

    const std::string& base_url() const { return base_url_; }
    const std::string& tracking_id() const { return tracking_id_; }

    // Shortest decimal text that round-trips typical sensor values
    static std::string format_number(double v);

private:
    Config config_;
    std::string tracking_id_;
    std::string base_url_;
    bool configured_ = false;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sinks
