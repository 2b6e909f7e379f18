// src/app/telemetry_main.cpp
#include "can/bus_listener.hpp"
#include "can/signal_catalog.hpp"
#include "can/socketcan_iface.hpp"
#include "config/app_config.hpp"
#include "gps/nmea_position_source.hpp"
#include "obd/obd_client.hpp"
#include "serial/serial_port.hpp"
#include "sinks/meshtastic_serial_sink.hpp"
#include "sinks/mqtt_publisher.hpp"
#include "sinks/traccar_client.hpp"
#include "telemetry/aggregator.hpp"
#include "telemetry/device_id.hpp"
#include "telemetry/supervisor.hpp"
#include "utils/clock.hpp"
#include "utils/logging.hpp"
#include "utils/stop_signal.hpp"
#include "utils/worker.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <curl/curl.h>
#include <getopt.h>

static volatile std::sig_atomic_t g_stop = 0;
static void on_signal(int) { g_stop = 1; }

static void print_usage(const char* prog_name) {
    printf("Usage: %s [options]\n", prog_name);
    printf("\nOptions:\n");
    printf("  --config PATH, -c PATH   Config YAML (default: config/telemetry_hub.yaml)\n");
    printf("  --log-level LEVEL, -l    Override general.log_level\n");
    printf("                           (TRACE|DEBUG|INFO|WARN|ERROR|FATAL|OFF)\n");
    printf("  --help, -h               Show this help\n");
    printf("\nExamples:\n");
    printf("  %s --config /etc/telemetry_hub.yaml\n", prog_name);
    printf("  %s --log-level DEBUG\n\n", prog_name);
}

static void configure_logging(const config::GeneralConfig& general) {
    utils::LogLevel lvl = utils::LogLevel::Info;
    if (!utils::parse_level(general.log_level, lvl)) {
        LOG_WARN("Unknown log level '%s', using INFO", general.log_level.c_str());
    }
    utils::set_level(lvl);
    if (!general.log_file.empty()) {
        utils::open_log_file(general.log_file);
    }
}

int main(int argc, char** argv) {
    std::string config_path = "config/telemetry_hub.yaml";
    std::string level_override;

    // ========================================================================
    // Command-line parsing
    // ========================================================================
    static struct option long_options[] = {
        {"config",    required_argument, 0, 'c'},
        {"log-level", required_argument, 0, 'l'},
        {"help",      no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "c:l:h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                config_path = optarg;
                break;
            case 'l': {
                utils::LogLevel parsed;
                if (!utils::parse_level(optarg, parsed)) {
                    fprintf(stderr, "Error: Invalid log level: %s\n", optarg);
                    return 1;
                }
                level_override = optarg;
                break;
            }
            case 'h':
            default:
                print_usage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    utils::set_level(utils::LogLevel::Info);

    // ========================================================================
    // Configuration
    // ========================================================================
    config::AppConfig cfg;
    try {
        cfg = config::AppConfig::load(config_path);
    } catch (const std::exception& e) {
        LOG_FATAL("%s", e.what());
        return 1;
    }
    if (!level_override.empty()) {
        cfg.general.log_level = level_override;
    }
    cfg.validate();
    configure_logging(cfg.general);
    cfg.print_summary();

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        LOG_FATAL("curl_global_init failed");
        return 1;
    }

    // The handler only flips g_stop; the watcher forwards it to the pipeline
    // so that retries and waits during startup are interrupted as well.
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    auto stop = std::make_shared<utils::StopSignal>();
    utils::StopSignal watcher_done;
    utils::Worker signal_watcher;
    signal_watcher.start("signal-watcher", [&watcher_done, stop]() {
        while (!watcher_done.wait_for(0.1)) {
            if (g_stop) {
                stop->set();
            }
        }
    });

    int exit_code = 0;
    try {

        // ====================================================================
        // CAN bus
        // ====================================================================
        std::shared_ptr<can::SampleQueue> queue;
        std::shared_ptr<can::BusListener> listener;
        if (cfg.can.enabled) {
            queue = std::make_shared<can::SampleQueue>(static_cast<size_t>(cfg.can.queue_size));

            can::BusListenerConfig bus_cfg;
            bus_cfg.channel = cfg.can.channel;
            bus_cfg.connection_retries = cfg.can.connection_retries;
            bus_cfg.retry_delay_s = cfg.can.retry_delay_s;
            bus_cfg.receive_timeout_s = cfg.can.receive_timeout_s;

            LOG_INFO("CAN %s on %s (bitrate %d is set by the OS for socketcan)",
                     cfg.can.interface_type.c_str(), cfg.can.channel.c_str(), cfg.can.bitrate);

            listener = std::make_shared<can::BusListener>(
                bus_cfg,
                []() -> std::unique_ptr<can::CanBus> { return std::make_unique<can::SocketCanIface>(); },
                can::SignalCatalog::build(cfg.can.message_definitions),
                queue,
                stop);
        } else {
            LOG_INFO("CAN disabled");
        }

        // ====================================================================
        // Identity and sinks
        // ====================================================================
        telemetry::Collaborators collaborators;

        // Mesh first: its node id may become the device id
        if (cfg.mesh.enabled) {
            auto port = std::make_unique<serial::SerialPort>();
            port->open(cfg.mesh.device, cfg.mesh.baudrate);

            sinks::MeshtasticSerialSink::Config mesh_cfg;
            mesh_cfg.device = cfg.mesh.device;
            mesh_cfg.node_id = cfg.mesh.node_id;
            mesh_cfg.max_payload_bytes = static_cast<size_t>(cfg.mesh.max_payload_bytes);
            auto mesh = std::make_shared<sinks::MeshtasticSerialSink>(mesh_cfg, std::move(port));
            if (mesh->is_connected()) {
                collaborators.mesh = mesh;
            }
        }

        const std::string device_id =
            telemetry::resolve_device_id(cfg.general, collaborators.mesh.get(), utils::wall_seconds());
        LOG_INFO("Device id: %s", device_id.c_str());

        if (cfg.gps.enabled) {
            auto port = std::make_unique<serial::SerialPort>();
            port->open(cfg.gps.device, cfg.gps.baudrate);

            gps::NmeaPositionSource::Config gps_cfg;
            gps_cfg.device = cfg.gps.device;
            gps_cfg.stale_after_s = cfg.gps.stale_after_s;
            auto position = std::make_shared<gps::NmeaPositionSource>(gps_cfg, std::move(port));
            if (position->start()) {
                collaborators.position = position;
            }
        }

        if (cfg.obd.enabled && !stop->is_set()) {
            obd::ObdClient::Config obd_cfg;
            obd_cfg.channel = cfg.obd.channel;
            obd_cfg.commands = cfg.obd.commands;
            obd_cfg.include_dtc_codes = cfg.obd.include_dtc_codes;
            obd_cfg.request_timeout_s = cfg.obd.request_timeout_s;
            obd_cfg.connection_retries = cfg.obd.connection_retries;
            obd_cfg.retry_delay_s = cfg.obd.retry_delay_s;
            auto client = std::make_shared<obd::ObdClient>(
                obd_cfg,
                []() -> std::unique_ptr<can::CanBus> { return std::make_unique<can::SocketCanIface>(); },
                stop);
            if (client->connect()) {
                collaborators.diagnostic = client;
            } else {
                LOG_WARN("OBD unavailable, continuing without diagnostics");
            }
        }

        if (cfg.mqtt.enabled) {
            sinks::MqttPublisher::Config mqtt_cfg;
            mqtt_cfg.enabled = true;
            mqtt_cfg.host = cfg.mqtt.host;
            mqtt_cfg.port = cfg.mqtt.port;
            mqtt_cfg.user = cfg.mqtt.user;
            mqtt_cfg.password = cfg.mqtt.password;
            mqtt_cfg.topic_prefix = cfg.mqtt.topic_prefix;
            mqtt_cfg.connection_timeout_s = cfg.mqtt.connection_timeout_s;
            auto publisher = std::make_shared<sinks::MqttPublisher>(mqtt_cfg, device_id);
            if (publisher->is_configured()) {
                collaborators.message_bus = publisher;
            }
        }

        if (cfg.traccar.enabled) {
            sinks::TraccarClient::Config traccar_cfg;
            traccar_cfg.enabled = true;
            traccar_cfg.host = cfg.traccar.host;
            traccar_cfg.port = cfg.traccar.port;
            traccar_cfg.use_http = cfg.traccar.use_http;
            traccar_cfg.http_path = cfg.traccar.http_path;
            traccar_cfg.request_timeout_s = cfg.traccar.request_timeout_s;
            traccar_cfg.convert_speed_to_knots = cfg.traccar.convert_speed_to_knots;
            auto client = std::make_shared<sinks::TraccarClient>(
                traccar_cfg, telemetry::resolve_tracking_id(cfg.traccar, device_id));
            if (client->is_configured()) {
                collaborators.tracking = client;
            }
        }

        // ====================================================================
        // Pipeline
        // ====================================================================
        telemetry::AggregatorConfig agg_cfg;
        agg_cfg.data_interval_s = cfg.general.data_interval_s;
        agg_cfg.tracking_report_interval_s = cfg.traccar.report_interval_s;
        agg_cfg.message_bus_sub_topic = cfg.mqtt.data_sub_topic;

        auto aggregator = std::make_shared<telemetry::Aggregator>(
            agg_cfg, collaborators, queue, stop, device_id);

        telemetry::Supervisor supervisor(stop, listener, aggregator, collaborators);

        if (g_stop) {
            LOG_INFO("Shutdown requested during startup");
        } else if (!supervisor.start()) {
            if (g_stop) {
                LOG_INFO("Shutdown requested during startup");
            } else {
                LOG_FATAL("Pipeline failed to start");
                exit_code = 1;
            }
        } else {
            LOG_INFO("Running, press Ctrl+C to stop");
            while (!g_stop && supervisor.is_running()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            LOG_INFO("Shutdown requested");
        }

        supervisor.stop();
    } catch (const std::exception& e) {
        LOG_FATAL("Startup failed: %s", e.what());
        exit_code = 1;
    }

    watcher_done.set();
    if (!signal_watcher.join_for(1.0)) {
        LOG_WARN("Signal watcher did not exit");
    }

    curl_global_cleanup();
    utils::close_log_file();
    return exit_code;
}
