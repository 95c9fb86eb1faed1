/**
 * @file IMappingAuthority.hpp
 * @brief Interface for the external endpoint-to-egress mapping authority.
 */

#pragma once

#include "core/types/EgressMapping.hpp"

#include <functional>
#include <future>
#include <memory>
#include <string>

namespace trafficpulse::core {

/**
 * @brief Result of a mapping fetch.
 */
struct MappingFetchResult {
    bool success{false};      ///< True if a complete mapping was obtained
    EgressMapping mapping;    ///< The fetched mapping (valid only on success)
    std::string errorMessage; ///< Failure description if the fetch failed
};

/**
 * @brief Interface for fetching the current endpoint-to-egress mapping.
 */
class IMappingAuthority {
public:
    /**
     * @brief Callback invoked when a fetch completes.
     * @param result The outcome of the fetch.
     */
    using FetchCallback = std::function<void(const MappingFetchResult&)>;

    virtual ~IMappingAuthority() = default;

    /**
     * @brief Starts an asynchronous fetch.
     * @param callback Function invoked exactly once with the outcome.
     */
    virtual void fetchAsync(FetchCallback callback) = 0;

    /**
     * @brief Starts an asynchronous fetch and returns its outcome as a future.
     * @return Future that will contain the fetch result.
     */
    std::future<MappingFetchResult> fetch() {
        auto promise = std::make_shared<std::promise<MappingFetchResult>>();
        auto future = promise->get_future();
        fetchAsync([promise](const MappingFetchResult& result) { promise->set_value(result); });
        return future;
    }
};

} // namespace trafficpulse::core
