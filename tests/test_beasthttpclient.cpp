// tests/test_beasthttpclient.cpp
#include <memory>
#include <optional>
#include <string>

#include "gtest/gtest.h"

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "../src/config/AppConfig.hpp"
#include "../src/core/BeastHttpClient.hpp"
#include "../src/core/Errors.hpp"
#include "TestMocks.hpp"

namespace http = boost::beast::http;
using json = nlohmann::json;

namespace {
    std::string str(boost::beast::string_view view) {
        return std::string(view.data(), view.size());
    }

    http::response<http::string_body> makeResponse(http::status status, const std::string& body) {
        http::response<http::string_body> res{status, 11};
        res.body() = body;
        res.prepare_payload();
        return res;
    }
}

class BeastHttpClientTest : public ::testing::Test {
protected:
    AppConfig config;
    std::unique_ptr<BeastHttpClient> client;

    void SetUp() override {
        config.api_token = "secret_abc";
        client = std::make_unique<BeastHttpClient>(config, makeQuietLogger());
    }
};

TEST_F(BeastHttpClientTest, BuildRequestCarriesAuthAndVersionHeaders) {
    auto req = client->buildRequest("GET", "/pages/p1", std::nullopt);

    EXPECT_EQ(req.method(), http::verb::get);
    EXPECT_EQ(str(req.target()), "/v1/pages/p1");
    EXPECT_EQ(str(req[http::field::host]), "api.notion.com");
    EXPECT_EQ(str(req[http::field::authorization]), "Bearer secret_abc");
    EXPECT_EQ(str(req[http::field::content_type]), "application/json");
    EXPECT_EQ(str(req["Notion-Version"]), "2022-06-28");
    EXPECT_TRUE(req.body().empty());
}

TEST_F(BeastHttpClientTest, BuildRequestSerialisesBody) {
    json body = {{"query", "SOP"}};
    auto req = client->buildRequest("POST", "/search", body);

    EXPECT_EQ(req.method(), http::verb::post);
    EXPECT_EQ(json::parse(req.body()), body);
    EXPECT_EQ(str(req[http::field::content_length]), std::to_string(req.body().size()));
}

TEST_F(BeastHttpClientTest, BuildRequestRejectsUnknownMethod) {
    EXPECT_THROW(client->buildRequest("FETCH", "/pages/p1", std::nullopt), std::invalid_argument);
}

TEST_F(BeastHttpClientTest, BuildRequestUsesConfiguredBasePath) {
    AppConfig custom;
    custom.api_token = "t";
    custom.api_endpoint.host = "proxy.internal";
    custom.api_endpoint.base_path = "/notion/v1";
    BeastHttpClient proxied(custom, makeQuietLogger());

    auto req = proxied.buildRequest("PATCH", "/blocks/b1/children", json{{"children", json::array()}});
    EXPECT_EQ(req.method(), http::verb::patch);
    EXPECT_EQ(str(req.target()), "/notion/v1/blocks/b1/children");
    EXPECT_EQ(str(req[http::field::host]), "proxy.internal");
}

TEST_F(BeastHttpClientTest, RejectsPlainHttpEndpoint) {
    AppConfig insecure;
    insecure.api_endpoint.is_https = false;
    EXPECT_THROW(std::make_unique<BeastHttpClient>(insecure, makeQuietLogger()), ConfigError);
}

TEST(BeastHttpClientResponseTest, SuccessBodyIsParsed) {
    json parsed = BeastHttpClient::parseResponse(makeResponse(http::status::ok, R"({"object":"page","id":"p1"})"));
    EXPECT_EQ(parsed["id"], "p1");
}

TEST(BeastHttpClientResponseTest, EmptySuccessBodyIsEmptyObject) {
    json parsed = BeastHttpClient::parseResponse(makeResponse(http::status::no_content, ""));
    EXPECT_TRUE(parsed.is_object());
    EXPECT_TRUE(parsed.empty());
}

TEST(BeastHttpClientResponseTest, ErrorStatusBecomesApiError) {
    const std::string body = R"({"object":"error","status":404,"code":"object_not_found"})";
    try {
        BeastHttpClient::parseResponse(makeResponse(http::status::not_found, body));
        FAIL() << "Expected ApiError";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.status(), 404);
        EXPECT_EQ(e.body(), body);
        EXPECT_EQ(std::string(e.what()), "Notion API error (404): " + body);
    }
}

TEST(BeastHttpClientResponseTest, RateLimitIsApiError) {
    EXPECT_THROW(BeastHttpClient::parseResponse(makeResponse(http::status::too_many_requests, "slow down")), ApiError);
}

TEST(BeastHttpClientResponseTest, MalformedSuccessBodyIsTransportError) {
    EXPECT_THROW(BeastHttpClient::parseResponse(makeResponse(http::status::ok, "<html>")), TransportError);
}
