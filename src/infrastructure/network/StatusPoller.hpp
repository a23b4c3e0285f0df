#pragma once

#include "core/services/IPingService.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/registry/HostRegistry.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

namespace hostwake::infra {

/**
 * @brief Timing of the status poller.
 */
struct PollerSettings {
    std::chrono::milliseconds interval{3000};     ///< Pause between the end of one cycle and the next
    std::chrono::milliseconds probeTimeout{500};  ///< Timeout of each echo request
};

/**
 * @brief Periodically probes every registered host and stores its status.
 *
 * Each cycle works on a snapshot of the registry, so hosts added or removed
 * while it runs are picked up by the next cycle. Probes are isolated: an
 * exception or error for one host marks only that host as Error. Status
 * writes go through HostRegistry::setStatus and are not persisted.
 *
 * The poller is a chain of steady_timer waits on the given AsioContext;
 * stop() cancels the pending wait.
 */
class StatusPoller : public std::enable_shared_from_this<StatusPoller> {
public:
    StatusPoller(AsioContext& context, std::shared_ptr<HostRegistry> registry,
                 std::shared_ptr<core::IPingService> pingService, PollerSettings settings = {});

    ~StatusPoller();

    StatusPoller(const StatusPoller&) = delete;
    StatusPoller& operator=(const StatusPoller&) = delete;

    /**
     * @brief Starts polling; the first cycle runs immediately.
     */
    void start();

    /**
     * @brief Cancels the pending cycle. A cycle already in progress completes.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Probes every host once on the calling thread.
     */
    void runCycle();

    /**
     * @brief Number of cycles completed since construction.
     */
    uint64_t completedCycles() const { return completedCycles_.load(); }

    /**
     * @brief Maps a probe result to the status stored for the host.
     */
    static core::HostStatus statusFromResult(const core::PingResult& result);

private:
    void scheduleNextCycle(std::chrono::milliseconds delay);

    std::shared_ptr<HostRegistry> registry_;
    std::shared_ptr<core::IPingService> pingService_;
    PollerSettings settings_;

    asio::steady_timer timer_;
    std::mutex timerMutex_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> completedCycles_{0};
};

} // namespace hostwake::infra
