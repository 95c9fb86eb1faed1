#include "infrastructure/mapping/MappingRefresher.hpp"

#include <spdlog/spdlog.h>

namespace trafficpulse::infra {

MappingRefresher::MappingRefresher(AsioContext& context,
                                   std::shared_ptr<core::IMappingAuthority> authority,
                                   EgressResolver& resolver, std::chrono::seconds interval)
    : authority_(std::move(authority)), resolver_(resolver),
      interval_(interval.count() > 0 ? interval : std::chrono::seconds(10)),
      strand_(asio::make_strand(context.getContext())), timer_(strand_) {}

MappingRefresher::~MappingRefresher() {
    stop();
}

void MappingRefresher::start() {
    if (running_.exchange(true)) {
        return;
    }

    scheduleNextRefresh();
    spdlog::info("Refreshing NIC mappings every {}s", interval_.count());
}

void MappingRefresher::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // Timer operations stay on the strand while handlers may be in flight
    if (auto self = weak_from_this().lock()) {
        asio::post(strand_, [self]() { self->timer_.cancel(); });
    } else {
        timer_.cancel();
    }
}

void MappingRefresher::scheduleNextRefresh() {
    if (!running_.load()) {
        return;
    }

    timer_.expires_after(interval_);

    auto self = shared_from_this();
    timer_.async_wait([this, self](const asio::error_code& ec) {
        if (ec || !running_.load()) {
            return;
        }

        refreshNow([this, self](bool /*replaced*/) {
            asio::post(strand_, [this, self]() { scheduleNextRefresh(); });
        });
    });
}

void MappingRefresher::refreshNow(std::function<void(bool)> onDone) {
    auto self = shared_from_this();

    authority_->fetchAsync([this, self, onDone = std::move(onDone)](
                               const core::MappingFetchResult& result) {
        if (result.success) {
            resolver_.replace(result.mapping);
            ++successes_;
            spdlog::info("Updated NIC mappings ({} endpoints)", result.mapping.mappings.size());
        } else {
            ++failures_;
            spdlog::error("Failed to fetch NIC mappings: {}", result.errorMessage);
        }

        if (onDone) {
            onDone(result.success);
        }
    });
}

} // namespace trafficpulse::infra
