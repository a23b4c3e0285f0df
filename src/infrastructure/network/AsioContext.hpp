#pragma once

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <optional>
#include <thread>
#include <vector>

namespace hostwake::infra {

/**
 * @brief Owns an asio::io_context and the worker threads that run it.
 *
 * A small pool of worker threads runs the context. Probes block the worker
 * that executes them, so the status poller runs on a separate single-thread
 * instance and the HTTP pool keeps at least two threads.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of worker threads (at least one is used).
     */
    explicit AsioContext(size_t threadCount = 4);

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Starts the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Stops the I/O context and joins all worker threads.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    asio::io_context& getContext() { return ioContext_; }

    /**
     * @brief Blocks the calling thread until SIGINT or SIGTERM is received.
     * @param onSignal Called on a worker thread with the signal number before returning.
     */
    void waitForTerminationSignal(const std::function<void(int)>& onSignal = {});

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace hostwake::infra
