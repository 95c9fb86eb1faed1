#pragma once

#include "core/services/IMappingAuthority.hpp"
#include "infrastructure/accounting/EgressResolver.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace trafficpulse::infra {

/**
 * @brief Periodically re-fetches the egress mapping and swaps it into the resolver.
 *
 * A successful fetch replaces the resolver's snapshot wholesale. A failed fetch
 * is logged and leaves the current snapshot untouched; the next tick retries.
 *
 * @note Create with std::make_shared; pending timers and fetches keep the
 *       refresher alive.
 */
class MappingRefresher : public std::enable_shared_from_this<MappingRefresher> {
public:
    /**
     * @brief Constructs a MappingRefresher.
     * @param context AsioContext that runs the refresh timer.
     * @param authority Source of fresh mappings.
     * @param resolver Resolver whose snapshot is replaced.
     * @param interval Time between refreshes.
     */
    MappingRefresher(AsioContext& context, std::shared_ptr<core::IMappingAuthority> authority,
                     EgressResolver& resolver,
                     std::chrono::seconds interval = std::chrono::seconds(10));

    ~MappingRefresher();

    MappingRefresher(const MappingRefresher&) = delete;
    MappingRefresher& operator=(const MappingRefresher&) = delete;

    /**
     * @brief Starts the refresh timer. The first refresh happens after one interval.
     */
    void start();

    /**
     * @brief Cancels the refresh timer. A fetch already in flight still completes.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Fetches once and applies the result.
     * @param onDone Optional callback receiving whether the mapping was replaced.
     */
    void refreshNow(std::function<void(bool)> onDone = nullptr);

    uint64_t successfulRefreshes() const { return successes_.load(); }
    uint64_t failedRefreshes() const { return failures_.load(); }

private:
    void scheduleNextRefresh();

    std::shared_ptr<core::IMappingAuthority> authority_;
    EgressResolver& resolver_;
    std::chrono::seconds interval_;

    asio::strand<asio::io_context::executor_type> strand_;
    asio::steady_timer timer_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> successes_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace trafficpulse::infra
