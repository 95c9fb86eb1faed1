#pragma once

#include "core/services/IMappingAuthority.hpp"
#include "infrastructure/mapping/HttpClient.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace trafficpulse::infra {

/**
 * @brief Fetches the endpoint-to-egress mapping from the router status service.
 *
 * The status document has the form
 * @code
 * { "config": {"lan": "eth2", "wan0": "eth0", "wan1": "eth1"},
 *   "mappings": {"10.40.1.5": "wan0", "10.40.1.6": "wan1"} }
 * @endcode
 */
class HttpMappingAuthority : public core::IMappingAuthority {
public:
    /**
     * @brief Constructs an HttpMappingAuthority.
     * @param context AsioContext used for the HTTP requests.
     * @param url URL of the status document.
     * @param timeoutMs Request timeout in milliseconds.
     */
    HttpMappingAuthority(AsioContext& context, std::string url, int timeoutMs = 5000);

    void fetchAsync(FetchCallback callback) override;

    /**
     * @brief Builds a mapping from a parsed status document.
     * @throws nlohmann::json::exception if a required field is missing or has the wrong type.
     */
    static core::EgressMapping mappingFromJson(const nlohmann::json& document);

    /**
     * @brief Serializes a mapping to the status document format.
     */
    static nlohmann::json mappingToJson(const core::EgressMapping& mapping);

    const std::string& url() const { return url_; }

private:
    HttpClient client_;
    std::string url_;
    int timeoutMs_;
};

} // namespace trafficpulse::infra
