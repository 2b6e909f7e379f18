// src/telemetry/supervisor.cpp
#include "telemetry/supervisor.hpp"
#include "utils/logging.hpp"

#include <stdexcept>

namespace telemetry {

namespace {

template <typename T>
void close_one(const char* name, std::shared_ptr<T>& collaborator) {
    if (!collaborator) {
        return;
    }
    try {
        collaborator->close();
        LOG_INFO("[Supervisor] Closed %s", name);
    } catch (const std::exception& e) {
        LOG_ERROR("[Supervisor] Error closing %s: %s", name, e.what());
    }
    collaborator.reset();
}

} // namespace

Supervisor::Supervisor(std::shared_ptr<utils::StopSignal> stop,
                       std::shared_ptr<can::BusListener> listener,
                       std::shared_ptr<Aggregator> aggregator,
                       Collaborators collaborators)
    : stop_(std::move(stop))
    , listener_(std::move(listener))
    , aggregator_(std::move(aggregator))
    , collaborators_(std::move(collaborators))
{
    if (!stop_ || !aggregator_) {
        throw std::invalid_argument("Supervisor requires a stop signal and an aggregator");
    }
}

Supervisor::~Supervisor() {
    stop();
}

bool Supervisor::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            LOG_ERROR("[Supervisor] Cannot restart after stop()");
            return false;
        }
        if (starting_) {
            LOG_WARN("[Supervisor] Start already in progress");
            return false;
        }
        if (aggregator_worker_.running()) {
            LOG_WARN("[Supervisor] Already running");
            return true;
        }

        LOG_INFO("[Supervisor] Starting pipeline (device %s)", aggregator_->device_id().c_str());
        stop_->clear();
        starting_ = true;
    }

    // Retries wait on the stop signal; stop() may run meanwhile
    if (listener_) {
        try {
            if (!listener_->is_connected()) {
                listener_->connect();
            }
            if (listener_->is_connected() && !stop_->is_set()) {
                listener_->start();
            } else if (!listener_->is_connected()) {
                LOG_WARN("[Supervisor] CAN bus unavailable (%s), continuing without bus data",
                         can::to_string(listener_->state()));
            }
        } catch (const std::exception& e) {
            LOG_ERROR("[Supervisor] CAN bus startup failed: %s", e.what());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    starting_ = false;
    start_done_.notify_all();
    if (stopped_) {
        LOG_WARN("[Supervisor] Stop requested during startup");
        return false;
    }

    auto aggregator = aggregator_;
    aggregator_worker_.start("aggregator", [aggregator]() { aggregator->run(); });
    LOG_INFO("[Supervisor] Aggregator thread started");
    return true;
}

void Supervisor::stop() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (stopped_) {
        return;
    }
    stopped_ = true;

    LOG_INFO("[Supervisor] Stopping...");
    stop_->set();

    // A concurrent start() is abandoning its bus retries; let it finish
    start_done_.wait(lock, [this] { return !starting_; });

    if (listener_) {
        listener_->stop();
    }

    if (aggregator_worker_.joinable()) {
        const double grace = aggregator_->config().data_interval_s + kAggregatorJoinGraceS;
        if (!aggregator_worker_.join_for(grace)) {
            LOG_WARN("[Supervisor] Aggregator thread did not stop within %.1f s", grace);
        }
    }

    close_collaborators();
    LOG_INFO("[Supervisor] Stopped");
}

void Supervisor::close_collaborators() {
    close_one("tracking sink", collaborators_.tracking);
    close_one("message bus sink", collaborators_.message_bus);
    close_one("mesh sink", collaborators_.mesh);
    close_one("diagnostic source", collaborators_.diagnostic);
    close_one("position source", collaborators_.position);

    if (listener_) {
        try {
            listener_->close();
            LOG_INFO("[Supervisor] Closed CAN bus");
        } catch (const std::exception& e) {
            LOG_ERROR("[Supervisor] Error closing CAN bus: %s", e.what());
        }
    }
}

bool Supervisor::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aggregator_worker_.running();
}

bool Supervisor::is_stopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
}

} // namespace telemetry
