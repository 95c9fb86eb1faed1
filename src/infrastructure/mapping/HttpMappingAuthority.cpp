#include "infrastructure/mapping/HttpMappingAuthority.hpp"

namespace trafficpulse::infra {

HttpMappingAuthority::HttpMappingAuthority(AsioContext& context, std::string url, int timeoutMs)
    : client_(context), url_(std::move(url)), timeoutMs_(timeoutMs) {}

core::EgressMapping HttpMappingAuthority::mappingFromJson(const nlohmann::json& document) {
    core::EgressMapping mapping;

    const auto& config = document.at("config");
    mapping.config.lan = config.at("lan").get<std::string>();
    mapping.config.wan0 = config.at("wan0").get<std::string>();
    mapping.config.wan1 = config.at("wan1").get<std::string>();

    mapping.mappings = document.at("mappings").get<std::map<std::string, std::string>>();
    return mapping;
}

nlohmann::json HttpMappingAuthority::mappingToJson(const core::EgressMapping& mapping) {
    nlohmann::json j;
    j["config"]["lan"] = mapping.config.lan;
    j["config"]["wan0"] = mapping.config.wan0;
    j["config"]["wan1"] = mapping.config.wan1;
    j["mappings"] = mapping.mappings;
    return j;
}

void HttpMappingAuthority::fetchAsync(FetchCallback callback) {
    auto onResponse = [callback = std::move(callback)](const HttpResponse& response) {
        core::MappingFetchResult result;

        if (!response.success) {
            result.errorMessage = response.errorMessage;
            callback(result);
            return;
        }

        try {
            result.mapping = mappingFromJson(nlohmann::json::parse(response.body));
            result.success = true;
        } catch (const nlohmann::json::exception& e) {
            result.errorMessage = std::string("Invalid status document: ") + e.what();
        }

        callback(result);
    };

    client_.getAsync(url_, timeoutMs_, std::move(onResponse));
}

} // namespace trafficpulse::infra
