#ifndef BEAST_HTTP_CLIENT_HPP
#define BEAST_HTTP_CLIENT_HPP

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../config/AppConfig.hpp"
#include "../interfaces/IHttpClient.hpp"
#include "../interfaces/ILogger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

using json = nlohmann::json;

// IHttpClient over Boost.Beast + TLS. Each call runs its own io_context on the
// calling thread, so one instance can serve several threads at once.
class BeastHttpClient : public IHttpClient {
public:
    BeastHttpClient(const AppConfig& config, std::shared_ptr<ILogger> logger);
    ~BeastHttpClient() override = default;

    BeastHttpClient(const BeastHttpClient&) = delete;
    BeastHttpClient& operator=(const BeastHttpClient&) = delete;

    json request(const std::string& method,
                 const std::string& endpoint,
                 const std::optional<json>& body = std::nullopt) override;

    // Exposed for tests: the request exactly as it would go on the wire.
    http::request<http::string_body> buildRequest(const std::string& method,
                                                  const std::string& endpoint,
                                                  const std::optional<json>& body) const;

    // Maps a raw response to a JSON body or an ApiError/TransportError.
    static json parseResponse(const http::response<http::string_body>& response);

private:
    http::response<http::string_body> sendOnce(const http::request<http::string_body>& req) const;

    const AppConfig& config_;
    std::shared_ptr<ILogger> logger_;
    mutable boost::asio::ssl::context ssl_ctx_;
};

#endif // BEAST_HTTP_CLIENT_HPP
