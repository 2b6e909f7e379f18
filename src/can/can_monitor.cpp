// src/can/can_monitor.cpp
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <map>
#include <string>
#include <vector>

#include "can/frame_decoder.hpp"
#include "can/signal_catalog.hpp"
#include "can/socketcan_iface.hpp"
#include "config/app_config.hpp"
#include "utils/logging.hpp"

static volatile std::sig_atomic_t g_stop = 0;
static void on_sigint(int) { g_stop = 1; }

static bool parse_u32(const std::string& s, uint32_t& out) {
    char* end = nullptr;
    errno = 0;
    unsigned long v = std::strtoul(s.c_str(), &end, 0);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    out = static_cast<uint32_t>(v);
    return true;
}

static std::vector<uint32_t> parse_id_list(const std::string& s) {
    // e.g. "0x200,0x201,0x220"
    std::vector<uint32_t> ids;
    std::string cur;
    for (char ch : s) {
        if (ch == ',') {
            if (!cur.empty()) {
                uint32_t v = 0;
                if (parse_u32(cur, v) && v <= 0x7FF) ids.push_back(v);
                cur.clear();
            }
        } else if (!std::isspace(static_cast<unsigned char>(ch))) {
            cur.push_back(ch);
        }
    }
    if (!cur.empty()) {
        uint32_t v = 0;
        if (parse_u32(cur, v) && v <= 0x7FF) ids.push_back(v);
    }
    return ids;
}

// Latest value per signal, redrawn in place
struct LiveMonitor {
    std::map<std::string, double> latest_values;
    uint64_t frame_count = 0;
    std::time_t start_time;

    LiveMonitor() {
        start_time = std::time(nullptr);
    }

    void update(const std::string& signal, double value) {
        latest_values[signal] = value;
    }

    void print_dashboard() {
        std::printf("\033[2J\033[H");  // Clear screen and move cursor to top

        std::time_t now = std::time(nullptr);
        double elapsed = std::difftime(now, start_time);

        std::printf("CAN signal monitor  |  frames: %llu  |  elapsed: %.0f s\n",
                    (unsigned long long)frame_count, elapsed);
        std::printf("----------------------------------------------------------\n");
        for (const auto& kv : latest_values) {
            std::printf("  %-32s %16.4f\n", kv.first.c_str(), kv.second);
        }
        std::printf("\n[Press Ctrl+C to exit]\n");
        std::fflush(stdout);
    }
};

int main(int argc, char** argv) {
    std::signal(SIGINT, on_sigint);
    utils::set_level(utils::LogLevel::Info);

    if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        std::printf("Usage: %s IFACE CONFIG.yaml [--filter=0x123,0x1A0] [--live] [--unknown]\n", argv[0]);
        return 0;
    }

    const char* ifname   = (argc > 1) ? argv[1] : "vcan0";
    const char* cfg_path = (argc > 2) ? argv[2] : "config/telemetry_hub.yaml";

    // Flags:
    //   --filter=0x200,0x201  (optional SocketCAN filter, 11-bit ids)
    //   --live                (redraw a table of latest values)
    //   --unknown             (also log frames with no definition)
    bool live_mode = false;
    bool show_unknown = false;
    std::vector<uint32_t> filter_ids;

    for (int i = 3; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--filter=", 0) == 0) {
            filter_ids = parse_id_list(a.substr(std::string("--filter=").size()));
        } else if (a == "--live") {
            live_mode = true;
        } else if (a == "--unknown") {
            show_unknown = true;
        } else {
            LOG_WARN("Ignoring unknown flag: %s", a.c_str());
        }
    }

    can::SignalCatalog catalog;
    try {
        config::AppConfig cfg = config::AppConfig::load(cfg_path);
        catalog = can::SignalCatalog::build(cfg.can.message_definitions);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load config %s: %s", cfg_path, e.what());
        return 1;
    }
    if (catalog.empty()) {
        LOG_ERROR("No usable message definitions in %s", cfg_path);
        return 1;
    }

    can::SocketCanIface iface;
    if (!iface.open(ifname)) {
        LOG_ERROR("Failed to open SocketCAN iface: %s", ifname);
        return 1;
    }

    if (!filter_ids.empty()) {
        if (!iface.set_filters(filter_ids)) {
            LOG_ERROR("Failed to set CAN filters");
            return 1;
        }
        LOG_INFO("Filter enabled (%zu IDs)", filter_ids.size());
    }

    LOG_INFO("Listening on %s", ifname);
    LOG_INFO("Definitions: %zu signals on %zu ids from %s",
             catalog.signal_count(), catalog.frame_count(), cfg_path);

    LiveMonitor monitor;
    uint64_t update_counter = 0;
    const uint64_t update_interval = 10;  // redraw every 10 frames in live mode

    while (!g_stop) {
        can::RawFrame frame;
        const can::RxStatus status = iface.receive(frame, 500);
        if (status == can::RxStatus::Timeout) continue;
        if (status == can::RxStatus::Error) {
            LOG_ERROR("Bus error on %s, exiting", ifname);
            return 1;
        }

        if (!catalog.find(frame.arbitration_id)) {
            if (show_unknown) {
                LOG_INFO("RX 0x%03X (no definition) dlc=%d", frame.arbitration_id, (int)frame.size);
            }
            continue;
        }

        auto decoded = can::FrameDecoder::decode(frame, catalog);

        if (live_mode) {
            for (const auto& sample : decoded) {
                monitor.update(sample.name, sample.value);
            }
            monitor.frame_count++;
            update_counter++;
            if (update_counter >= update_interval) {
                monitor.print_dashboard();
                update_counter = 0;
            }
        } else {
            LOG_INFO("RX 0x%03X dlc=%d", frame.arbitration_id, (int)frame.size);
            for (const auto& sample : decoded) {
                LOG_INFO("  %-24s = %.6f", sample.name.c_str(), sample.value);
            }
        }
    }

    LOG_INFO("Stopped");
    return 0;
}
