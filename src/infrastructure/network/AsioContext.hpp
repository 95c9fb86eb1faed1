#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace trafficpulse::infra {

/**
 * @brief Owns the asio::io_context shared by timers and HTTP I/O, plus its worker threads.
 *
 * The metrics publisher, the mapping refresher, the exposition server and the
 * HTTP client all run their handlers here. Packet capture never does: its
 * blocking reads live on a dedicated thread.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext with the specified number of worker threads.
     * @param threadCount Number of worker threads (at least one is used).
     */
    explicit AsioContext(size_t threadCount = 2);

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Spawns the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Stops the io_context and joins all worker threads.
     *
     * Pending handlers are discarded. The context can be started again.
     */
    void stop();

    /**
     * @brief Checks whether the worker threads are running.
     */
    bool isRunning() const { return running_.load(); }

    /**
     * @brief Returns the underlying io_context.
     */
    asio::io_context& getContext() { return ioContext_; }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace trafficpulse::infra
