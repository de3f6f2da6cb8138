#ifndef HTTPS_CLIENT_SESSION_HPP
#define HTTPS_CLIENT_SESSION_HPP

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "../interfaces/ILogger.hpp"
#include "../models/ApiEndpointInfo.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

// One HTTPS request/response exchange:
// resolve -> connect -> TLS handshake -> write -> read.
// on_complete is invoked exactly once, with either the response or an error.
class HttpsClientSession : public std::enable_shared_from_this<HttpsClientSession> {
    tcp::resolver resolver_;
    beast::ssl_stream<beast::tcp_stream> stream_;
    beast::flat_buffer buffer_; // Must persist for reads
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
    const ApiEndpointInfo& endpoint_;
    std::function<void(http::response<http::string_body>, beast::error_code)> on_complete_;
    std::shared_ptr<ILogger> logger_;
    net::steady_timer timer_;
    bool completed_ = false;

public:
    HttpsClientSession(
        net::io_context& ioc,
        ssl::context& ssl_ctx,
        const ApiEndpointInfo& endpoint,
        http::request<http::string_body> request,
        std::chrono::milliseconds timeout,
        std::function<void(http::response<http::string_body>, beast::error_code)> on_complete,
        std::shared_ptr<ILogger> logger = nullptr)
        : resolver_(ioc),
          stream_(ioc, ssl_ctx),
          req_(std::move(request)),
          endpoint_(endpoint),
          on_complete_(std::move(on_complete)),
          logger_(logger),
          timer_(ioc) {
        // Overall deadline for the whole exchange
        timer_.expires_after(timeout);
    }

    void run() {
        // SNI is required by most TLS front ends
        if (!SSL_set_tlsext_host_name(stream_.native_handle(), endpoint_.host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            return complete({}, ec);
        }
        stream_.set_verify_callback(ssl::host_name_verification(endpoint_.host));

        timer_.async_wait(beast::bind_front_handler(&HttpsClientSession::on_timeout, shared_from_this()));
        do_resolve();
    }

    // Stops whatever step is pending. Handlers that still arrive see completed_ and return.
    void cancel() {
        timer_.cancel();
        resolver_.cancel();
        beast::error_code ec;
        beast::get_lowest_layer(stream_).socket().close(ec);
    }

private:
    void complete(http::response<http::string_body> res, beast::error_code ec) {
        if (completed_) {
            return;
        }
        completed_ = true;
        timer_.cancel();
        on_complete_(std::move(res), ec);
    }

    void on_timeout(beast::error_code ec) {
        if (ec == net::error::operation_aborted) {
            return; // Timer cancelled: the exchange finished first
        }
        if (logger_) logger_->warn("HttpsClientSession timeout for " + endpoint_.url + std::string(req_.target().data(), req_.target().size()));
        complete({}, beast::errc::make_error_code(beast::errc::timed_out));
        cancel();
    }

    void do_resolve() {
        resolver_.async_resolve(
            endpoint_.host,
            std::to_string(endpoint_.port),
            beast::bind_front_handler(&HttpsClientSession::on_resolve, shared_from_this()));
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (completed_) return;
        if (ec) return complete({}, ec);
        beast::get_lowest_layer(stream_).async_connect(
            results,
            beast::bind_front_handler(&HttpsClientSession::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (completed_) return;
        if (ec) return complete({}, ec);
        stream_.async_handshake(
            ssl::stream_base::client,
            beast::bind_front_handler(&HttpsClientSession::on_handshake, shared_from_this()));
    }

    void on_handshake(beast::error_code ec) {
        if (completed_) return;
        if (ec) return complete({}, ec);
        http::async_write(stream_, req_,
            beast::bind_front_handler(&HttpsClientSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);
        if (completed_) return;
        if (ec) return complete({}, ec);
        http::async_read(stream_, buffer_, res_,
            beast::bind_front_handler(&HttpsClientSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);
        if (completed_) return;

        // The response is complete; skip the TLS close_notify exchange and drop the connection.
        beast::error_code shut_ec;
        beast::get_lowest_layer(stream_).socket().shutdown(tcp::socket::shutdown_both, shut_ec);
        if (shut_ec && shut_ec != beast::errc::not_connected) {
            if (logger_) logger_->debug("HttpsClientSession shutdown error: " + shut_ec.message());
        }

        complete(std::move(res_), ec == http::error::end_of_stream ? beast::error_code{} : ec);
    }
};

#endif // HTTPS_CLIENT_SESSION_HPP
