#pragma once

#include "core/status.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace optiscan::network {

/// HTTP failure; status 0 means the request never got a response
struct HttpError {
    int status{0};
    std::string message;

    [[nodiscard]] bool is_transport() const noexcept { return status == 0; }

    /// Worth retrying: transport failure, rate limit or server error
    [[nodiscard]] bool is_transient() const noexcept {
        return status == 0 || status == 429 || status >= 500;
    }

    /// Provider has nothing for this request
    [[nodiscard]] bool is_no_data() const noexcept {
        return status == 404 || status == 204;
    }
};

using HttpResult = Result<std::string, HttpError>;

/// Async HTTPS client for REST API calls
class RestClient : public std::enable_shared_from_this<RestClient> {
public:
    using tcp = boost::asio::ip::tcp;
    using ssl_stream = boost::asio::ssl::stream<tcp::socket>;

    /// Response handler callback
    using ResponseHandler = std::function<void(HttpResult)>;

    /// Create a new REST client
    /// @param ioc IO context for async operations
    /// @param ssl_ctx Shared SSL context
    RestClient(
        boost::asio::io_context& ioc,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx
    );

    ~RestClient();

    // Non-copyable, non-movable
    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

    /// Send "Authorization: Bearer <key>" with the request
    void set_api_key(std::string api_key);

    /// Perform an async GET request
    /// @param host Hostname (e.g., "api.thetadata.net")
    /// @param port Port (e.g., "443")
    /// @param target Path with query (e.g., "/v1/options/chain?root=SPY")
    /// @param handler Callback with response body or error
    void get(
        std::string_view host,
        std::string_view port,
        std::string_view target,
        ResponseHandler handler
    );

    /// Perform an async POST request with a JSON body
    void post(
        std::string_view host,
        std::string_view port,
        std::string_view target,
        std::string body,
        ResponseHandler handler
    );

private:
    void start(boost::beast::http::verb method, std::string_view host,
               std::string_view port, std::string_view target, ResponseHandler handler);
    void do_resolve();
    void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results);
    void do_connect(tcp::resolver::results_type::endpoint_type ep);
    void on_connect(boost::system::error_code ec);
    void do_ssl_handshake();
    void on_ssl_handshake(boost::system::error_code ec);
    void do_write();
    void on_write(boost::system::error_code ec, std::size_t bytes_transferred);
    void do_read();
    void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void do_shutdown();
    void on_shutdown(boost::system::error_code ec);
    void fail(const std::string& what, boost::system::error_code ec);
    void complete(HttpResult result);

    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    tcp::resolver resolver_;
    std::unique_ptr<ssl_stream> stream_;
    boost::beast::flat_buffer buffer_;
    boost::beast::http::request<boost::beast::http::string_body> req_;
    boost::beast::http::response<boost::beast::http::string_body> res_;

    std::string host_;
    std::string port_;
    std::string target_;
    std::string body_;
    std::string api_key_;
    boost::beast::http::verb method_{boost::beast::http::verb::get};
    ResponseHandler handler_;
};

/// Description of a blocking request
struct HttpRequest {
    std::string host;
    std::string port = "443";
    std::string target;
    std::string body;      // non-empty => POST
    std::string api_key;   // empty => no Authorization header
    std::chrono::milliseconds timeout{10000};
};

/// Run one request on a private io_context and wait for the response
/// Safe to call concurrently from several threads
[[nodiscard]] HttpResult perform_request(
    const std::shared_ptr<boost::asio::ssl::context>& ssl_ctx,
    const HttpRequest& request
);

}  // namespace optiscan::network
