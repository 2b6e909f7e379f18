// test/test_aggregator.cpp
/**
 * Unit Test: Aggregator
 *
 * Runs aggregation cycles against in-memory collaborators and manual
 * clocks.
 *
 * Test Coverage:
 *   1. Nothing collected -> no snapshot, no dispatch
 *   2. Bus samples merged, last value per name wins
 *   3. Tracking rate limit (30 s limit, cycles 5 s apart)
 *   4. Tracking needs a valid fix
 *   5. Collaborator exceptions contained per call
 *   6. Disconnected / unconfigured sinks skipped
 *   7. Snapshot timestamps never go backwards
 *   8. run() loop paces and stops on the signal
 *   9. Constructor argument checks
 *  10. Non-std exceptions contained per call and in run()
 *  11. A fix with no fields counts as no position
 */

#include "telemetry/aggregator.hpp"
#include "utils/logging.hpp"
#include <iostream>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <thread>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET  "\033[0m"

struct TestResult {
    int passed = 0;
    int failed = 0;

    void pass(const std::string& msg) {
        std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
        ++passed;
    }

    void fail(const std::string& msg) {
        std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
        ++failed;
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

bool is_close(double actual, double expected, double tolerance = 1e-9) {
    return std::abs(actual - expected) < tolerance;
}

// ============================================================================
// Fakes
// ============================================================================

struct ManualClock {
    std::shared_ptr<double> now;
    explicit ManualClock(double start) : now(std::make_shared<double>(start)) {}
    telemetry::Aggregator::ClockFn fn() const {
        auto t = now;
        return [t] { return *t; };
    }
    void advance(double s) { *now += s; }
};

class FakePosition : public telemetry::PositionSource {
public:
    bool connected = true;
    bool throws = false;
    std::optional<telemetry::GpsFix> fix;
    int calls = 0;

    bool is_connected() const override { return connected; }
    std::optional<telemetry::GpsFix> get_position() override {
        ++calls;
        if (throws) throw std::runtime_error("serial port gone");
        return fix;
    }
    void close() override {}
};

class FakeDiagnostic : public telemetry::DiagnosticSource {
public:
    bool connected = true;
    bool throws = false;
    telemetry::DiagnosticReading reading;

    bool is_connected() const override { return connected; }
    telemetry::DiagnosticReading read() override {
        if (throws) throw std::runtime_error("ELM327 timeout");
        return reading;
    }
    void close() override {}
};

class FakeMesh : public telemetry::MeshSink {
public:
    bool connected = true;
    bool throws = false;
    int sends = 0;

    bool is_connected() const override { return connected; }
    bool send(const telemetry::Snapshot&) override {
        if (throws) throw std::runtime_error("radio reset");
        ++sends;
        return true;
    }
    void close() override {}
};

class FakeMessageBus : public telemetry::MessageBusSink {
public:
    bool throws_int = false;
    int publishes = 0;
    std::string last_sub_topic;
    telemetry::Snapshot last;

    bool is_connected() const override { return true; }
    bool publish(const telemetry::Snapshot& snap, const std::string& sub_topic) override {
        if (throws_int) throw 42;
        ++publishes;
        last_sub_topic = sub_topic;
        last = snap;
        return true;
    }
    void close() override {}
};

class FakeTracking : public telemetry::TrackingSink {
public:
    bool configured = true;
    int sends = 0;

    bool is_configured() const override { return configured; }
    bool send(const telemetry::Snapshot&) override {
        ++sends;
        return true;
    }
    void close() override {}
};

telemetry::GpsFix valid_fix() {
    telemetry::GpsFix fix;
    fix.latitude = 52.52;
    fix.longitude = 13.405;
    fix.speed = 12.5;
    return fix;
}

void push_sample(can::SampleQueue& q, const std::string& name, double value) {
    can::DecodedSample s;
    s.timestamp = 1.0;
    s.name = name;
    s.value = value;
    q.try_push(s);
}

// ============================================================================
// Tests
// ============================================================================

// Test 1
void test_empty_cycle(TestResult& result) {
    std::cout << "\n=== Test 1: Nothing Collected ===\n";

    auto position = std::make_shared<FakePosition>();
    position->connected = false;
    auto mesh = std::make_shared<FakeMesh>();
    auto bus = std::make_shared<FakeMessageBus>();
    auto tracking = std::make_shared<FakeTracking>();

    telemetry::Collaborators c;
    c.position = position;
    c.mesh = mesh;
    c.message_bus = bus;
    c.tracking = tracking;

    ManualClock wall(1700000000.0), mono(100.0);
    telemetry::Aggregator agg(telemetry::AggregatorConfig(), c,
                              std::make_shared<can::SampleQueue>(10),
                              std::make_shared<utils::StopSignal>(), "truck-07",
                              wall.fn(), mono.fn());

    auto report = agg.run_cycle();

    if (!report.snapshot_built && !report.snapshot) {
        result.pass("No snapshot built");
    } else {
        result.fail("Empty cycle built a snapshot");
    }

    if (mesh->sends == 0 && bus->publishes == 0 && tracking->sends == 0) {
        result.pass("No sink called");
    } else {
        result.fail("A sink was called for an empty cycle");
    }

    if (position->calls == 0) {
        result.pass("Disconnected position source not polled");
    } else {
        result.fail("Disconnected position source polled");
    }
}

// Test 2
void test_bus_samples_merged(TestResult& result) {
    std::cout << "\n=== Test 2: Bus Samples, Last Value Wins ===\n";

    auto queue = std::make_shared<can::SampleQueue>(10);
    push_sample(*queue, "EngineRPM", 750.0);
    push_sample(*queue, "CoolantTemp", 88.0);
    push_sample(*queue, "EngineRPM", 900.0);

    auto mesh = std::make_shared<FakeMesh>();
    auto bus = std::make_shared<FakeMessageBus>();
    telemetry::Collaborators c;
    c.mesh = mesh;
    c.message_bus = bus;

    telemetry::AggregatorConfig cfg;
    cfg.message_bus_sub_topic = "can";
    ManualClock wall(1700000000.0), mono(100.0);
    telemetry::Aggregator agg(cfg, c, queue, std::make_shared<utils::StopSignal>(),
                              "truck-07", wall.fn(), mono.fn());

    auto report = agg.run_cycle();

    if (report.snapshot_built && report.samples_drained == 3 && queue->empty()) {
        result.pass("Queue fully drained");
    } else {
        result.fail("Drain wrong (" + std::to_string(report.samples_drained) + ")");
        return;
    }

    const auto& signals = report.snapshot->bus_signals;
    if (signals.size() == 2 && is_close(signals.at("EngineRPM"), 900.0) &&
        is_close(signals.at("CoolantTemp"), 88.0)) {
        result.pass("EngineRPM = 900 (latest), CoolantTemp = 88");
    } else {
        result.fail("bus_signals wrong");
    }

    if (report.snapshot->device_id == "truck-07" &&
        is_close(report.snapshot->timestamp_utc, 1700000000.0)) {
        result.pass("Snapshot stamped with device id and wall time");
    } else {
        result.fail("Snapshot identity wrong");
    }

    if (report.mesh_sent && mesh->sends == 1 && report.message_bus_sent &&
        bus->publishes == 1 && bus->last_sub_topic == "can") {
        result.pass("Mesh and message bus each called once, sub-topic 'can'");
    } else {
        result.fail("Dispatch wrong");
    }

    if (!agg.run_cycle().snapshot_built) {
        result.pass("Drained samples are not replayed next cycle");
    } else {
        result.fail("Second cycle rebuilt from old samples");
    }
}

// Test 3
void test_tracking_rate_limit(TestResult& result) {
    std::cout << "\n=== Test 3: Tracking Rate Limit ===\n";

    auto position = std::make_shared<FakePosition>();
    position->fix = valid_fix();
    auto bus = std::make_shared<FakeMessageBus>();
    auto tracking = std::make_shared<FakeTracking>();

    telemetry::Collaborators c;
    c.position = position;
    c.message_bus = bus;
    c.tracking = tracking;

    telemetry::AggregatorConfig cfg;
    cfg.data_interval_s = 5.0;
    cfg.tracking_report_interval_s = 30.0;
    ManualClock wall(1700000000.0), mono(100.0);
    telemetry::Aggregator agg(cfg, c, nullptr, std::make_shared<utils::StopSignal>(),
                              "truck-07", wall.fn(), mono.fn());

    int throttled = 0;
    for (int i = 0; i < 6; ++i) {
        auto report = agg.run_cycle();
        if (report.tracking_throttled) ++throttled;
        wall.advance(5.0);
        mono.advance(5.0);
    }

    if (tracking->sends == 1 && throttled == 5) {
        result.pass("t=0..25 s: only the first cycle reaches tracking");
    } else {
        result.fail("sends = " + std::to_string(tracking->sends) +
                    ", throttled = " + std::to_string(throttled));
    }

    if (bus->publishes == 6) {
        result.pass("Message bus unaffected by tracking limit");
    } else {
        result.fail("Message bus publishes = " + std::to_string(bus->publishes));
    }

    auto report = agg.run_cycle();
    if (report.tracking_sent && tracking->sends == 2) {
        result.pass("t=30 s: tracking sent again");
    } else {
        result.fail("Tracking not sent after the interval");
    }
}

// Test 4
void test_tracking_needs_fix(TestResult& result) {
    std::cout << "\n=== Test 4: Tracking Needs A Valid Fix ===\n";

    auto position = std::make_shared<FakePosition>();
    telemetry::GpsFix null_island;
    null_island.latitude = 0.0;
    null_island.longitude = 0.0;
    position->fix = null_island;
    auto tracking = std::make_shared<FakeTracking>();

    telemetry::Collaborators c;
    c.position = position;
    c.tracking = tracking;

    ManualClock wall(1700000000.0), mono(100.0);
    telemetry::Aggregator agg(telemetry::AggregatorConfig(), c, nullptr,
                              std::make_shared<utils::StopSignal>(), "truck-07",
                              wall.fn(), mono.fn());

    auto report = agg.run_cycle();
    if (report.snapshot_built && !report.tracking_sent && !report.tracking_throttled &&
        tracking->sends == 0) {
        result.pass("0,0 fix: snapshot built, tracking skipped");
    } else {
        result.fail("Tracking called with an invalid fix");
    }

    position->fix = valid_fix();
    report = agg.run_cycle();
    if (report.tracking_sent && tracking->sends == 1) {
        result.pass("Skipped cycle did not consume the rate limit");
    } else {
        result.fail("Valid fix right after an invalid one was throttled");
    }

    telemetry::GpsFix lat_only;
    lat_only.latitude = 52.0;
    if (!lat_only.has_valid_position() && valid_fix().has_valid_position()) {
        result.pass("has_valid_position requires both coordinates");
    } else {
        result.fail("has_valid_position wrong");
    }
}

// Test 5
void test_exceptions_contained(TestResult& result) {
    std::cout << "\n=== Test 5: Collaborator Exceptions ===\n";

    auto position = std::make_shared<FakePosition>();
    position->throws = true;
    auto diag = std::make_shared<FakeDiagnostic>();
    diag->reading.sensors["coolant_temp"] = 91.0;
    diag->reading.sensors["fuel_level"] = std::nullopt;
    diag->reading.dtcs = {"P0301"};
    auto mesh = std::make_shared<FakeMesh>();
    mesh->throws = true;
    auto bus = std::make_shared<FakeMessageBus>();

    telemetry::Collaborators c;
    c.position = position;
    c.diagnostic = diag;
    c.mesh = mesh;
    c.message_bus = bus;

    ManualClock wall(1700000000.0), mono(100.0);
    telemetry::Aggregator agg(telemetry::AggregatorConfig(), c, nullptr,
                              std::make_shared<utils::StopSignal>(), "truck-07",
                              wall.fn(), mono.fn());

    telemetry::CycleReport report;
    bool threw = false;
    try {
        report = agg.run_cycle();
    } catch (const std::exception&) {
        threw = true;
    }

    if (!threw) {
        result.pass("run_cycle() did not throw");
    } else {
        result.fail("Collaborator exception escaped run_cycle()");
        return;
    }

    if (report.snapshot_built && !report.snapshot->gps &&
        report.snapshot->sensors.size() == 2 && !report.snapshot->sensors.at("fuel_level") &&
        report.snapshot->dtcs.size() == 1) {
        result.pass("Diagnostics collected despite position failure");
    } else {
        result.fail("Snapshot contents wrong");
    }

    if (!report.mesh_sent && report.message_bus_sent && bus->publishes == 1) {
        result.pass("Mesh failure did not block the message bus");
    } else {
        result.fail("Message bus skipped after mesh failure");
    }
}

// Test 6
void test_inactive_sinks_skipped(TestResult& result) {
    std::cout << "\n=== Test 6: Inactive Sinks Skipped ===\n";

    auto position = std::make_shared<FakePosition>();
    position->fix = valid_fix();
    auto diag = std::make_shared<FakeDiagnostic>();
    diag->connected = false;
    diag->reading.sensors["rpm"] = 800.0;
    auto mesh = std::make_shared<FakeMesh>();
    mesh->connected = false;
    auto tracking = std::make_shared<FakeTracking>();
    tracking->configured = false;

    telemetry::Collaborators c;
    c.position = position;
    c.diagnostic = diag;
    c.mesh = mesh;
    c.tracking = tracking;

    ManualClock wall(1700000000.0), mono(100.0);
    telemetry::Aggregator agg(telemetry::AggregatorConfig(), c, nullptr,
                              std::make_shared<utils::StopSignal>(), "truck-07",
                              wall.fn(), mono.fn());

    auto report = agg.run_cycle();

    if (report.snapshot_built && report.snapshot->sensors.empty() && report.snapshot->gps) {
        result.pass("Disconnected diagnostic source not read");
    } else {
        result.fail("Disconnected diagnostic source read");
    }

    if (mesh->sends == 0 && tracking->sends == 0 && !report.tracking_throttled) {
        result.pass("Disconnected mesh and unconfigured tracking skipped");
    } else {
        result.fail("Inactive sink called");
    }
}

// Test 7
void test_timestamps_monotonic(TestResult& result) {
    std::cout << "\n=== Test 7: Non-Decreasing Timestamps ===\n";

    auto queue = std::make_shared<can::SampleQueue>(10);
    telemetry::Collaborators c;
    ManualClock wall(1700000100.0), mono(100.0);
    telemetry::Aggregator agg(telemetry::AggregatorConfig(), c, queue,
                              std::make_shared<utils::StopSignal>(), "truck-07",
                              wall.fn(), mono.fn());

    push_sample(*queue, "EngineRPM", 800.0);
    auto first = agg.run_cycle();

    wall.advance(-60.0);   // NTP step backwards
    push_sample(*queue, "EngineRPM", 810.0);
    auto second = agg.run_cycle();

    if (first.snapshot && second.snapshot &&
        second.snapshot->timestamp_utc >= first.snapshot->timestamp_utc) {
        result.pass("Clock step back does not reorder snapshots");
    } else {
        result.fail("Snapshot timestamp went backwards");
    }
}

// Test 8
void test_run_loop(TestResult& result) {
    std::cout << "\n=== Test 8: run() Loop ===\n";

    auto diag = std::make_shared<FakeDiagnostic>();
    diag->reading.sensors["rpm"] = 800.0;
    auto bus = std::make_shared<FakeMessageBus>();
    telemetry::Collaborators c;
    c.diagnostic = diag;
    c.message_bus = bus;

    telemetry::AggregatorConfig cfg;
    cfg.data_interval_s = 0.2;
    auto stop = std::make_shared<utils::StopSignal>();
    telemetry::Aggregator agg(cfg, c, nullptr, stop, "truck-07");

    std::thread loop([&agg] { agg.run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    auto t0 = std::chrono::steady_clock::now();
    stop->set();
    loop.join();
    double join_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    const auto& stats = agg.pacing_stats();
    if (stats.total_cycles >= 2 && stats.total_cycles <= 4 && bus->publishes >= 2) {
        result.pass("Paced at the data interval (" + std::to_string(stats.total_cycles) + " cycles)");
    } else {
        result.fail("Unexpected cycle count " + std::to_string(stats.total_cycles));
    }

    if (join_s < 0.2) {
        result.pass("Stop wakes the loop immediately");
    } else {
        result.fail("Loop slept through the stop request");
    }

    if (agg.cycle_errors() == 0) {
        result.pass("No cycle errors");
    } else {
        result.fail("Cycle errors reported");
    }
}

// Test 9
void test_constructor_checks(TestResult& result) {
    std::cout << "\n=== Test 9: Constructor Checks ===\n";

    bool threw = false;
    try {
        telemetry::Aggregator agg(telemetry::AggregatorConfig(), telemetry::Collaborators(),
                                  nullptr, nullptr, "truck-07");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (threw) {
        result.pass("Null stop signal rejected");
    } else {
        result.fail("Null stop signal accepted");
    }

    threw = false;
    telemetry::AggregatorConfig cfg;
    cfg.data_interval_s = 0.0;
    try {
        telemetry::Aggregator agg(cfg, telemetry::Collaborators(), nullptr,
                                  std::make_shared<utils::StopSignal>(), "truck-07");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (threw) {
        result.pass("Zero data interval rejected");
    } else {
        result.fail("Zero data interval accepted");
    }

    threw = false;
    cfg.data_interval_s = 10.0;
    cfg.tracking_report_interval_s = -1.0;
    telemetry::Collaborators c;
    c.tracking = std::make_shared<FakeTracking>();
    try {
        telemetry::Aggregator agg(cfg, c, nullptr, std::make_shared<utils::StopSignal>(), "truck-07");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (threw) {
        result.pass("Negative tracking interval rejected when tracking is wired");
    } else {
        result.fail("Negative tracking interval accepted");
    }
}

// Test 10
void test_non_std_exceptions(TestResult& result) {
    std::cout << "\n=== Test 10: Non-std Exceptions ===\n";

    auto position = std::make_shared<FakePosition>();
    position->fix = valid_fix();
    auto bus = std::make_shared<FakeMessageBus>();
    bus->throws_int = true;
    auto tracking = std::make_shared<FakeTracking>();

    telemetry::Collaborators c;
    c.position = position;
    c.message_bus = bus;
    c.tracking = tracking;

    ManualClock wall(1700000000.0), mono(100.0);
    telemetry::Aggregator agg(telemetry::AggregatorConfig(), c, nullptr,
                              std::make_shared<utils::StopSignal>(), "truck-07",
                              wall.fn(), mono.fn());

    telemetry::CycleReport report;
    bool threw = false;
    try {
        report = agg.run_cycle();
    } catch (...) {
        threw = true;
    }

    if (!threw && report.snapshot_built && !report.message_bus_sent) {
        result.pass("int thrown by the message bus contained");
    } else {
        result.fail("int thrown by the message bus escaped run_cycle()");
        return;
    }

    if (report.tracking_sent && tracking->sends == 1) {
        result.pass("Tracking still sent after the message bus failure");
    } else {
        result.fail("Tracking skipped after the message bus failure");
    }

    // A wall clock that throws a non-std type fails the whole cycle; run() must survive it
    auto diag = std::make_shared<FakeDiagnostic>();
    diag->reading.sensors["rpm"] = 800.0;
    telemetry::Collaborators c2;
    c2.diagnostic = diag;

    auto clock_calls = std::make_shared<int>(0);
    telemetry::Aggregator::ClockFn flaky_clock = [clock_calls]() -> double {
        if ((*clock_calls)++ == 0) throw 42;
        return 1700000000.0;
    };

    telemetry::AggregatorConfig cfg;
    cfg.data_interval_s = 0.2;
    auto stop = std::make_shared<utils::StopSignal>();
    telemetry::Aggregator looping(cfg, c2, nullptr, stop, "truck-07", flaky_clock);

    std::thread loop([&looping] { looping.run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    stop->set();
    loop.join();

    if (looping.cycle_errors() == 1 && looping.pacing_stats().total_cycles >= 1) {
        result.pass("run() counted the failed cycle and kept going");
    } else {
        result.fail("cycle_errors = " + std::to_string(looping.cycle_errors()) +
                    ", cycles = " + std::to_string(looping.pacing_stats().total_cycles));
    }
}

// Test 11
void test_empty_fix_ignored(TestResult& result) {
    std::cout << "\n=== Test 11: Empty Fix Counts As No Position ===\n";

    auto position = std::make_shared<FakePosition>();
    position->fix = telemetry::GpsFix();
    auto bus = std::make_shared<FakeMessageBus>();

    telemetry::Collaborators c;
    c.position = position;
    c.message_bus = bus;

    ManualClock wall(1700000000.0), mono(100.0);
    telemetry::Aggregator agg(telemetry::AggregatorConfig(), c, nullptr,
                              std::make_shared<utils::StopSignal>(), "truck-07",
                              wall.fn(), mono.fn());

    auto report = agg.run_cycle();
    if (position->calls == 1 && !report.snapshot_built && bus->publishes == 0) {
        result.pass("Fix with no fields: no snapshot, nothing published");
    } else {
        result.fail("Empty fix produced a snapshot");
    }

    telemetry::Snapshot snap;
    snap.gps = telemetry::GpsFix();
    telemetry::GpsFix alt_only;
    alt_only.altitude = 34.0;
    telemetry::Snapshot with_alt;
    with_alt.gps = alt_only;
    if (snap.empty() && !with_alt.empty()) {
        result.pass("Snapshot::empty() looks inside the fix");
    } else {
        result.fail("Snapshot::empty() wrong for fix contents");
    }
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║              Aggregator Unit Tests                           ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    utils::set_level(utils::LogLevel::Off);

    TestResult result;

    test_empty_cycle(result);
    test_bus_samples_merged(result);
    test_tracking_rate_limit(result);
    test_tracking_needs_fix(result);
    test_exceptions_contained(result);
    test_inactive_sinks_skipped(result);
    test_timestamps_monotonic(result);
    test_run_loop(result);
    test_constructor_checks(result);
    test_non_std_exceptions(result);
    test_empty_fix_ignored(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
