// include/trade_pilot/advisory/http_advisory_client.hpp
#pragma once

#include <memory>
#include <string>
#include "trade_pilot/advisory/advisory_service.hpp"
#include "trade_pilot/core/engine_config.hpp"
#include "trade_pilot/data/http_client.hpp"

namespace trade_pilot {

/**
 * @brief Extract the JSON object embedded in a text reply
 *
 * Keeps the text between the first '{' and the last '}'; otherwise strips
 * markdown code fences.
 */
std::string sanitize_json_text(const std::string& text);

/**
 * @brief AdvisoryService speaking JSON over HTTP POST
 *
 * The API key is read once from the environment variable named in the
 * configuration and sent as a bearer token when present.
 */
class HttpAdvisoryClient : public AdvisoryService {
public:
    explicit HttpAdvisoryClient(AdvisoryConfig config,
                                std::shared_ptr<HttpClient> http = std::make_shared<HttpClient>());

    Result<nlohmann::json> request(const std::string& pair, const nlohmann::json& context,
                                   const CancellationToken& cancel) override;

    Result<nlohmann::json> summarize(const nlohmann::json& stats,
                                     const CancellationToken& cancel) override;

    bool has_api_key() const {
        return !api_key_.empty();
    }

private:
    Result<nlohmann::json> post(const nlohmann::json& payload, const CancellationToken& cancel);

    AdvisoryConfig config_;
    std::shared_ptr<HttpClient> http_;
    std::string api_key_;
};

}  // namespace trade_pilot
