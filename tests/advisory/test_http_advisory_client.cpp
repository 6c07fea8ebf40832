#include <gtest/gtest.h>
#include <cstdlib>
#include "core/test_base.hpp"
#include "trade_pilot/advisory/http_advisory_client.hpp"

using namespace trade_pilot;
using namespace trade_pilot::testing;

namespace {

class RecordingHttpClient : public HttpClient {
public:
    HttpResponse response{200, "{}", 1};
    bool fail{false};
    mutable HttpRequest last_request;

    Result<HttpResponse> perform(const HttpRequest& request,
                                 const CancellationToken*) const override {
        last_request = request;
        if (fail) {
            return make_error<HttpResponse>(ErrorCode::TIMEOUT_ERROR, "timed out",
                                            "RecordingHttpClient");
        }
        return response;
    }
};

}  // namespace

class HttpAdvisoryClientTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        http = std::make_shared<RecordingHttpClient>();
        config.endpoint = "http://advisor.local/v1";
        config.api_key_env = "TRADE_PILOT_TEST_ADVISORY_KEY";
        unsetenv(config.api_key_env.c_str());
    }

    void TearDown() override {
        unsetenv(config.api_key_env.c_str());
        TestBase::TearDown();
    }

    AdvisoryConfig config;
    std::shared_ptr<RecordingHttpClient> http;
    CancellationToken token;
};

TEST_F(HttpAdvisoryClientTest, SanitizeExtractsEmbeddedObject) {
    EXPECT_EQ(sanitize_json_text("Sure! {\"a\": {\"b\": 1}} hope that helps"),
              "{\"a\": {\"b\": 1}}");
    EXPECT_EQ(sanitize_json_text("```json\n{\"a\":1}\n```"), "{\"a\":1}");
    EXPECT_EQ(sanitize_json_text("```json\n[1,2]\n```"), "[1,2]");
    EXPECT_EQ(sanitize_json_text(""), "{}");
}

TEST_F(HttpAdvisoryClientTest, InsightRequestCarriesPairAndContext) {
    http->response.body = "```json\n{\"pair\":\"BTC/USDT\",\"confidence\":60}\n```";
    HttpAdvisoryClient client(config, http);
    EXPECT_FALSE(client.has_api_key());

    auto reply = client.request("BTC/USDT", {{"current_price", 96450.0}}, token);
    ASSERT_TRUE(reply.is_ok());
    EXPECT_EQ(reply.value().at("confidence").get<int>(), 60);

    EXPECT_EQ(http->last_request.method, "POST");
    EXPECT_EQ(http->last_request.url, "http://advisor.local/v1");
    auto payload = nlohmann::json::parse(http->last_request.body);
    EXPECT_EQ(payload.at("task"), "insight");
    EXPECT_EQ(payload.at("pair"), "BTC/USDT");
    EXPECT_DOUBLE_EQ(payload.at("context").at("current_price").get<double>(), 96450.0);
    for (const auto& header : http->last_request.headers) {
        EXPECT_EQ(header.find("Authorization"), std::string::npos);
    }
}

TEST_F(HttpAdvisoryClientTest, ApiKeyIsSentAsBearerToken) {
    setenv(config.api_key_env.c_str(), "secret-token", 1);
    HttpAdvisoryClient client(config, http);
    ASSERT_TRUE(client.has_api_key());

    ASSERT_TRUE(client.summarize({{"closed_trades", 0}}, token).is_ok());
    bool found = false;
    for (const auto& header : http->last_request.headers) {
        found = found || header == "Authorization: Bearer secret-token";
    }
    EXPECT_TRUE(found);
    EXPECT_EQ(nlohmann::json::parse(http->last_request.body).at("task"), "audit");
}

TEST_F(HttpAdvisoryClientTest, TransportAndStatusErrorsAreReported) {
    HttpAdvisoryClient client(config, http);

    http->fail = true;
    auto timed_out = client.request("BTC/USDT", {}, token);
    ASSERT_TRUE(timed_out.is_error());
    EXPECT_EQ(timed_out.error()->code(), ErrorCode::TIMEOUT_ERROR);

    http->fail = false;
    http->response = HttpResponse{503, "unavailable", 2};
    auto unavailable = client.request("BTC/USDT", {}, token);
    ASSERT_TRUE(unavailable.is_error());
    EXPECT_EQ(unavailable.error()->code(), ErrorCode::API_ERROR);

    http->response = HttpResponse{200, "", 2};
    EXPECT_EQ(client.request("BTC/USDT", {}, token).error()->code(), ErrorCode::INVALID_DATA);

    http->response = HttpResponse{200, "no json here", 2};
    EXPECT_EQ(client.request("BTC/USDT", {}, token).error()->code(),
              ErrorCode::JSON_PARSE_ERROR);
}
