// src/sinks/mqtt_publisher.cpp
#include "sinks/mqtt_publisher.hpp"
#include "sinks/snapshot_json.hpp"
#include "telemetry/device_id.hpp"
#include "utils/logging.hpp"

#include <curl/curl.h>

#include <sstream>
#include <stdexcept>

namespace sinks {

struct MqttPublisher::Impl {
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

// Broker answers nothing worth keeping for QoS 0
static size_t discard_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    (void)contents;
    (void)userp;
    return size * nmemb;
}

MqttPublisher::MqttPublisher(const Config& config, std::string device_id)
    : config_(config)
    , device_id_(std::move(device_id))
    , impl_(std::make_unique<Impl>())
{
    if (!config_.enabled) {
        LOG_INFO("[MQTT] Publisher created but disabled");
        return;
    }
    if (config_.host.empty()) {
        LOG_ERROR("[MQTT] No host configured, publisher disabled");
        return;
    }
    if (device_id_.empty() || telemetry::is_fallback_id(device_id_) ||
        device_id_.rfind("unknown", 0) == 0) {
        LOG_ERROR("[MQTT] Device id '%s' is not usable in topics, publisher disabled",
                  device_id_.c_str());
        return;
    }

    configured_ = true;
    LOG_INFO("[MQTT] Publisher initialized: broker=%s:%d topics=%s",
             config_.host.c_str(), config_.port, topic_for("<sub>").c_str());
}

MqttPublisher::~MqttPublisher() = default;

std::string MqttPublisher::topic_for(const std::string& sub_topic) const {
    return config_.topic_prefix + "/" + device_id_ + "/" + sub_topic;
}

std::string MqttPublisher::url_for(const std::string& topic) const {
    // Escape each topic level, keep the separators
    std::ostringstream url;
    url << "mqtt://" << config_.host << ":" << config_.port << "/";
    size_t start = 0;
    while (true) {
        const size_t slash = topic.find('/', start);
        url << impl_->escape(topic.substr(start, slash == std::string::npos ? std::string::npos
                                                                           : slash - start));
        if (slash == std::string::npos) {
            break;
        }
        url << "/";
        start = slash + 1;
    }
    return url.str();
}

bool MqttPublisher::publish_raw(const std::string& sub_topic, const std::string& payload) {
    if (!is_configured()) {
        LOG_DEBUG("[MQTT] Not configured, skipping publish");
        return false;
    }

    const std::string topic = topic_for(sub_topic);
    const std::string url = url_for(topic);

    curl_easy_reset(impl_->curl);
    curl_easy_setopt(impl_->curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, discard_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(impl_->curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(config_.connection_timeout_s * 1000.0));
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(config_.connection_timeout_s * 2000.0));
    if (!config_.user.empty()) {
        curl_easy_setopt(impl_->curl, CURLOPT_USERNAME, config_.user.c_str());
        curl_easy_setopt(impl_->curl, CURLOPT_PASSWORD, config_.password.c_str());
    }

    CURLcode res = curl_easy_perform(impl_->curl);
    if (res != CURLE_OK) {
        if (last_ok_) {
            LOG_WARN("[MQTT] Publish to '%s' failed: %s", topic.c_str(), curl_easy_strerror(res));
        } else {
            LOG_DEBUG("[MQTT] Publish to '%s' failed again: %s", topic.c_str(), curl_easy_strerror(res));
        }
        last_ok_ = false;
        return false;
    }

    if (!last_ok_) {
        LOG_INFO("[MQTT] Broker %s:%d reachable again", config_.host.c_str(), config_.port);
    }
    last_ok_ = true;
    LOG_DEBUG("[MQTT] Published %zu bytes to '%s'", payload.size(), topic.c_str());
    return true;
}

bool MqttPublisher::publish(const telemetry::Snapshot& snapshot, const std::string& sub_topic) {
    if (!is_configured()) {
        return false;
    }
    if (!announced_online_) {
        announced_online_ = publish_status(true);
    }
    return publish_raw(sub_topic, encode(snapshot));
}

bool MqttPublisher::publish_status(bool online) {
    return publish_raw(config_.status_sub_topic, online ? "online" : "offline");
}

void MqttPublisher::close() {
    if (!is_configured()) {
        closed_ = true;
        return;
    }
    if (announced_online_) {
        publish_status(false);
    }
    closed_ = true;
    LOG_INFO("[MQTT] Publisher closed");
}

} // namespace sinks
