// src/sinks/traccar_client.cpp
#include "sinks/traccar_client.hpp"
#include "utils/logging.hpp"
#include "utils/text.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace sinks {

// ============================================================================
// Private Implementation (Pimpl)
// ============================================================================

struct TraccarClient::Impl {
    CURL* curl = nullptr;

    Impl() {
        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }

    std::string escape(const std::string& s) const {
        char* out = curl_easy_escape(curl, s.c_str(), static_cast<int>(s.size()));
        if (!out) {
            throw std::runtime_error("curl_easy_escape failed");
        }
        std::string result(out);
        curl_free(out);
        return result;
    }
};

// Keeps the first 200 bytes of the answer for error logs
static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    const size_t n = size * nmemb;
    if (body->size() < 200) {
        body->append(static_cast<const char*>(contents), std::min(n, 200 - body->size()));
    }
    return n;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

TraccarClient::TraccarClient(const Config& config, std::string tracking_id)
    : config_(config)
    , tracking_id_(std::move(tracking_id))
    , impl_(std::make_unique<Impl>())
{
    if (!config_.enabled) {
        LOG_INFO("[Traccar] Client created but disabled");
        return;
    }
    if (tracking_id_.empty()) {
        LOG_ERROR("[Traccar] No device id, client disabled");
        return;
    }
    if (config_.host.empty()) {
        LOG_ERROR("[Traccar] No host configured, client disabled");
        return;
    }
    if (!config_.use_http) {
        LOG_WARN("[Traccar] Only the OsmAnd HTTP protocol is supported (use_http: true), client disabled");
        return;
    }

    std::string path = config_.http_path;
    if (path.empty() || path[0] != '/') {
        path = "/" + path;
    }

    std::ostringstream url;
    url << "http://" << config_.host << ":" << config_.port << path;
    base_url_ = url.str();
    configured_ = true;

    LOG_INFO("[Traccar] Client initialized: url=%s device=%s", base_url_.c_str(), tracking_id_.c_str());
}

TraccarClient::~TraccarClient() = default;

// ============================================================================
// Payload
// ============================================================================

std::string TraccarClient::format_number(double v) {
    if (std::isnan(v) || std::isinf(v)) {
        return "0";
    }
    if (v == std::floor(v) && std::fabs(v) < 1e15) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f", v);
        return buf;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.12g", v);
    return buf;
}

TraccarClient::Params TraccarClient::build_params(const telemetry::Snapshot& snapshot) const {
    Params params;
    params.emplace_back("id", tracking_id_);
    params.emplace_back("timestamp",
                        std::to_string(static_cast<long long>(std::floor(snapshot.timestamp_utc))));

    if (snapshot.gps && snapshot.gps->latitude && snapshot.gps->longitude) {
        const auto& gps = *snapshot.gps;
        params.emplace_back("lat", format_number(*gps.latitude));
        params.emplace_back("lon", format_number(*gps.longitude));
        if (gps.altitude) {
            params.emplace_back("altitude", format_number(*gps.altitude));
        }
        if (gps.speed) {
            const double speed = config_.convert_speed_to_knots ? utils::mps_to_knots(*gps.speed)
                                                                : *gps.speed;
            params.emplace_back("speed", format_number(std::round(speed * 100.0) / 100.0));
        }
        if (gps.course) {
            params.emplace_back("bearing", format_number(*gps.course));
        }
        if (gps.hdop) {
            params.emplace_back("hdop", format_number(*gps.hdop));
        }
    }

    for (const auto& kv : snapshot.sensors) {
        if (kv.second) {
            params.emplace_back(utils::clean_sensor_name(kv.first), format_number(*kv.second));
        }
    }

    for (const auto& kv : snapshot.bus_signals) {
        params.emplace_back("can_" + utils::clean_sensor_name(kv.first), format_number(kv.second));
    }

    if (!snapshot.dtcs.empty()) {
        std::string joined;
        for (size_t i = 0; i < snapshot.dtcs.size(); ++i) {
            if (i > 0) {
                joined += ",";
            }
            joined += snapshot.dtcs[i];
        }
        params.emplace_back("dtcs", joined);
    }

    return params;
}

std::string TraccarClient::build_request_url(const telemetry::Snapshot& snapshot) const {
    std::string url = base_url_;
    const Params params = build_params(snapshot);
    for (size_t i = 0; i < params.size(); ++i) {
        url += (i == 0) ? "?" : "&";
        url += impl_->escape(params[i].first);
        url += "=";
        url += impl_->escape(params[i].second);
    }
    return url;
}

// ============================================================================
// HTTP Communication
// ============================================================================

bool TraccarClient::send(const telemetry::Snapshot& snapshot) {
    if (!configured_) {
        LOG_DEBUG("[Traccar] Not configured, skipping send");
        return false;
    }
    if (!snapshot.gps || !snapshot.gps->latitude || !snapshot.gps->longitude) {
        LOG_DEBUG("[Traccar] Skipping send: lat/lon missing");
        return false;
    }

    const std::string url = build_request_url(snapshot);
    std::string body;

    curl_easy_reset(impl_->curl);
    curl_easy_setopt(impl_->curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_POST, 1L);
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, "");
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE, 0L);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(impl_->curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(config_.request_timeout_s * 1000.0));

    LOG_DEBUG("[Traccar] POST %s", url.c_str());
    CURLcode res = curl_easy_perform(impl_->curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        LOG_WARN("[Traccar] Request timed out (%.0f s): %s", config_.request_timeout_s, base_url_.c_str());
        return false;
    }
    if (res != CURLE_OK) {
        LOG_WARN("[Traccar] Request failed: CURL error: %s (%s)", curl_easy_strerror(res), base_url_.c_str());
        return false;
    }

    long http_code = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code < 200 || http_code >= 300) {
        LOG_ERROR("[Traccar] HTTP %ld: %s", http_code, body.c_str());
        return false;
    }

    LOG_DEBUG("[Traccar] HTTP %ld", http_code);
    return true;
}

void TraccarClient::close() {
    if (configured_) {
        LOG_INFO("[Traccar] Client closed");
    }
    configured_ = false;
}

} // namespace sinks
