#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

namespace trafficpulse::infra {

AsioContext::AsioContext(size_t threadCount) : threadCount_(threadCount > 0 ? threadCount : 1) {}

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
            spdlog::debug("I/O worker {} started", i);
            // Keep serving after a handler throws
            for (;;) {
                try {
                    ioContext_.run();
                    break;
                } catch (const std::exception& e) {
                    spdlog::error("I/O worker {}: unhandled exception: {}", i, e.what());
                }
            }
            spdlog::debug("I/O worker {} stopped", i);
        });
    }

    spdlog::debug("AsioContext started with {} worker threads", threadCount_);
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
    spdlog::debug("AsioContext stopped");
}

} // namespace trafficpulse::infra
