// src/advisory/http_advisory_client.cpp
#include "trade_pilot/advisory/http_advisory_client.hpp"
#include <cstdlib>
#include "trade_pilot/core/logger.hpp"

namespace trade_pilot {

namespace {

void erase_all(std::string& text, const std::string& token) {
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.erase(pos, token.size());
    }
}

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    size_t begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

}  // namespace

std::string sanitize_json_text(const std::string& text) {
    if (text.empty()) {
        return "{}";
    }
    size_t first_open = text.find('{');
    size_t last_close = text.rfind('}');
    if (first_open != std::string::npos && last_close != std::string::npos &&
        last_close > first_open) {
        return text.substr(first_open, last_close - first_open + 1);
    }
    std::string stripped = text;
    erase_all(stripped, "```json");
    erase_all(stripped, "```");
    return trim(stripped);
}

HttpAdvisoryClient::HttpAdvisoryClient(AdvisoryConfig config, std::shared_ptr<HttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {
    if (!config_.api_key_env.empty()) {
        const char* env_key = std::getenv(config_.api_key_env.c_str());
        if (env_key) {
            api_key_ = env_key;
        }
    }
    if (api_key_.empty()) {
        DEBUG("No advisory API key in " << config_.api_key_env << ", sending unauthenticated");
    }
}

Result<nlohmann::json> HttpAdvisoryClient::request(const std::string& pair,
                                                   const nlohmann::json& context,
                                                   const CancellationToken& cancel) {
    nlohmann::json payload;
    payload["task"] = "insight";
    payload["pair"] = pair;
    payload["context"] = context;
    payload["schema"] = {"pair", "confidence", "action", "reasoning", "keyLevels"};
    return post(payload, cancel);
}

Result<nlohmann::json> HttpAdvisoryClient::summarize(const nlohmann::json& stats,
                                                     const CancellationToken& cancel) {
    nlohmann::json payload;
    payload["task"] = "audit";
    payload["stats"] = stats;
    payload["schema"] = {"rating", "efficiencyScore", "critique", "recommendedAdjustment"};
    return post(payload, cancel);
}

Result<nlohmann::json> HttpAdvisoryClient::post(const nlohmann::json& payload,
                                                const CancellationToken& cancel) {
    HttpRequest request;
    request.url = config_.endpoint;
    request.method = "POST";
    request.body = payload.dump();
    request.timeout_ms = config_.timeout_ms;
    request.headers.push_back("Content-Type: application/json");
    if (!api_key_.empty()) {
        request.headers.push_back("Authorization: Bearer " + api_key_);
    }

    auto response = http_->perform(request, &cancel);
    if (response.is_error()) {
        return make_error<nlohmann::json>(response.error()->code(), response.error()->what(),
                                          "HttpAdvisoryClient");
    }
    const auto& reply = response.value();
    if (reply.status < 200 || reply.status >= 300) {
        return make_error<nlohmann::json>(ErrorCode::API_ERROR,
                                          "Advisory service returned HTTP " +
                                              std::to_string(reply.status),
                                          "HttpAdvisoryClient");
    }
    if (reply.body.empty()) {
        return make_error<nlohmann::json>(ErrorCode::INVALID_DATA, "Empty advisory response",
                                          "HttpAdvisoryClient");
    }

    try {
        auto parsed = nlohmann::json::parse(sanitize_json_text(reply.body));
        DEBUG("Advisory response in " << reply.latency_ms << "ms");
        return parsed;
    } catch (const nlohmann::json::exception& e) {
        return make_error<nlohmann::json>(ErrorCode::JSON_PARSE_ERROR,
                                          std::string("Unparseable advisory response: ") +
                                              e.what(),
                                          "HttpAdvisoryClient");
    }
}

}  // namespace trade_pilot
