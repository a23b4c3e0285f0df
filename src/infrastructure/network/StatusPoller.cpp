#include "infrastructure/network/StatusPoller.hpp"

#include <spdlog/spdlog.h>

namespace hostwake::infra {

StatusPoller::StatusPoller(AsioContext& context, std::shared_ptr<HostRegistry> registry,
                           std::shared_ptr<core::IPingService> pingService, PollerSettings settings)
    : registry_(std::move(registry)), pingService_(std::move(pingService)),
      settings_(settings), timer_(context.getContext()) {}

StatusPoller::~StatusPoller() {
    stop();
}

void StatusPoller::start() {
    if (running_.exchange(true)) {
        return;
    }

    spdlog::info("Status poller started (interval {}ms, probe timeout {}ms)",
                 settings_.interval.count(), settings_.probeTimeout.count());
    scheduleNextCycle(std::chrono::milliseconds(0));
}

void StatusPoller::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    std::lock_guard lock(timerMutex_);
    timer_.cancel();
    spdlog::info("Status poller stopped");
}

core::HostStatus StatusPoller::statusFromResult(const core::PingResult& result) {
    if (result.success) {
        return core::HostStatus::Online;
    }
    return result.probeError ? core::HostStatus::Error : core::HostStatus::Offline;
}

void StatusPoller::runCycle() {
    auto hosts = registry_->list();

    for (const auto& host : hosts) {
        core::HostStatus status;
        try {
            auto result = pingService_->ping(host.ipAddress, settings_.probeTimeout);
            status = statusFromResult(result);
            if (result.probeError) {
                spdlog::warn("Ping error {}: {}", host.ipAddress, result.errorMessage);
            }
        } catch (const std::exception& e) {
            spdlog::warn("Ping error {}: {}", host.ipAddress, e.what());
            status = core::HostStatus::Error;
        }

        if (status != host.status) {
            spdlog::debug("Host {} ({}) is now {}", host.id, host.ipAddress,
                          core::Host{.status = status}.statusToString());
        }
        registry_->setStatus(host.id, status);
    }

    ++completedCycles_;
}

void StatusPoller::scheduleNextCycle(std::chrono::milliseconds delay) {
    std::lock_guard lock(timerMutex_);
    if (!running_.load()) {
        return;
    }

    auto self = shared_from_this();
    timer_.expires_after(delay);
    timer_.async_wait([this, self](const asio::error_code& ec) {
        if (ec || !running_.load()) {
            return;
        }

        runCycle();
        scheduleNextCycle(settings_.interval);
    });
}

} // namespace hostwake::infra
