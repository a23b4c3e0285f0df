#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <future>

namespace hostwake::infra {

AsioContext::AsioContext(size_t threadCount)
    : threadCount_(threadCount > 0 ? threadCount : 1) {
    spdlog::debug("AsioContext created with {} threads", threadCount_);
}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() {
            spdlog::debug("Asio worker thread {} started", i);
            ioContext_.run();
            spdlog::debug("Asio worker thread {} stopped", i);
        });
    }

    spdlog::info("AsioContext started with {} worker threads", threadCount_);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    ioContext_.restart();
    spdlog::info("AsioContext stopped");
}

void AsioContext::waitForTerminationSignal(const std::function<void(int)>& onSignal) {
    asio::signal_set signals(ioContext_, SIGINT, SIGTERM);
    std::promise<int> received;
    auto future = received.get_future();

    signals.async_wait([&received, &onSignal](const asio::error_code& ec, int signalNumber) {
        if (ec) {
            received.set_value(0);
            return;
        }
        spdlog::info("Received signal {}, shutting down", signalNumber);
        if (onSignal) {
            onSignal(signalNumber);
        }
        received.set_value(signalNumber);
    });

    future.wait();
}

} // namespace hostwake::infra
