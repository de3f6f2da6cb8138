#include "BeastHttpClient.hpp"

#include <boost/asio/io_context.hpp>

#include <algorithm>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "Errors.hpp"
#include "HttpsClientSession.hpp"

namespace {
    const std::string USER_AGENT = "notion-cli/1.0 " BOOST_BEAST_VERSION_STRING;
}

BeastHttpClient::BeastHttpClient(const AppConfig& config, std::shared_ptr<ILogger> logger)
    : config_(config),
      logger_(std::move(logger)),
      ssl_ctx_(boost::asio::ssl::context::tls_client) {
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    if (!config_.api_endpoint.is_https) {
        throw ConfigError("Only https API endpoints are supported: " + config_.api_endpoint.url);
    }
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(boost::asio::ssl::verify_peer);
    logger_->debug("BeastHttpClient initialized for " + config_.api_endpoint.url);
}

http::request<http::string_body> BeastHttpClient::buildRequest(
    const std::string& method,
    const std::string& endpoint,
    const std::optional<json>& body) const {
    http::verb verb = http::string_to_verb(method);
    if (verb == http::verb::unknown) {
        throw std::invalid_argument("Unsupported HTTP method: " + method);
    }

    http::request<http::string_body> req{verb, config_.api_endpoint.target(endpoint), 11};
    req.set(http::field::host, config_.api_endpoint.host);
    req.set(http::field::user_agent, USER_AGENT);
    req.set(http::field::authorization, "Bearer " + config_.api_token);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::accept, "application/json");
    req.set("Notion-Version", config_.notion_version);
    if (body) {
        req.body() = body->dump();
    }
    req.prepare_payload();
    return req;
}

json BeastHttpClient::request(const std::string& method,
                              const std::string& endpoint,
                              const std::optional<json>& body) {
    auto req = buildRequest(method, endpoint, body);

    // --- Call API with Retry ---
    // Only transport failures are retried; an HTTP status is a definitive answer.
    int max_retries = std::max(0, config_.request_max_retries);
    http::response<http::string_body> response;
    auto start_time = std::chrono::steady_clock::now();
    for (int attempt = 0; ; ++attempt) {
        try {
            response = sendOnce(req);
            break;
        } catch (const TransportError& e) {
            if (attempt >= max_retries) {
                logger_->warn("API call " + method + " " + endpoint + " failed: " + e.what());
                throw;
            }
            logger_->warn("API call " + method + " " + endpoint + " failed (attempt "
                + std::to_string(attempt + 1) + "), retrying: " + e.what());
        }
    }
    // --- End Call API with Retry ---

    if (logger_->isDebugEnabled()) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        std::stringstream ss;
        ss << method << " " << endpoint << " -> " << response.result_int()
           << " in " << elapsed.count() << "ms";
        logger_->debug(ss.str());
    }
    return parseResponse(response);
}

http::response<http::string_body> BeastHttpClient::sendOnce(const http::request<http::string_body>& req) const {
    boost::asio::io_context ioc;
    http::response<http::string_body> result;
    beast::error_code result_ec;
    bool finished = false;

    auto session = std::make_shared<HttpsClientSession>(
        ioc,
        ssl_ctx_,
        config_.api_endpoint,
        req,
        std::chrono::milliseconds(config_.request_timeout_in_millis),
        [&](http::response<http::string_body> res, beast::error_code ec) {
            result = std::move(res);
            result_ec = ec;
            finished = true;
        },
        logger_);
    session->run();
    ioc.run();

    if (!finished) {
        throw TransportError("Request to " + config_.api_endpoint.host + " ended without a response");
    }
    if (result_ec) {
        throw TransportError("Request to " + config_.api_endpoint.host + " failed: " + result_ec.message());
    }
    return result;
}

json BeastHttpClient::parseResponse(const http::response<http::string_body>& response) {
    int status = static_cast<int>(response.result_int());
    if (status < 200 || status >= 300) {
        throw ApiError(status, response.body());
    }
    if (response.body().empty()) {
        return json::object();
    }
    try {
        return json::parse(response.body());
    } catch (const json::parse_error& e) {
        throw TransportError("Invalid JSON in API response (status " + std::to_string(status) + "): " + e.what());
    }
}
