#include "network/rest_client.hpp"
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>
#include <optional>

// Helper to set SNI hostname without old-style cast warning
namespace {
inline bool set_sni_hostname(SSL* ssl, const char* hostname) {
    // SSL_set_tlsext_host_name is a macro with old-style cast
    // Use SSL_ctrl directly to avoid warning
    return SSL_ctrl(ssl, SSL_CTRL_SET_TLSEXT_HOSTNAME,
                    TLSEXT_NAMETYPE_host_name,
                    const_cast<char*>(hostname)) != 0;
}
}  // namespace

namespace optiscan::network {

namespace http = boost::beast::http;

RestClient::RestClient(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx
)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , resolver_(ioc)
{}

RestClient::~RestClient() {
    if (stream_) {
        boost::system::error_code ec;
        stream_->next_layer().close(ec);
    }
}

void RestClient::set_api_key(std::string api_key) {
    api_key_ = std::move(api_key);
}

void RestClient::get(
    std::string_view host,
    std::string_view port,
    std::string_view target,
    ResponseHandler handler
) {
    body_.clear();
    start(http::verb::get, host, port, target, std::move(handler));
}

void RestClient::post(
    std::string_view host,
    std::string_view port,
    std::string_view target,
    std::string body,
    ResponseHandler handler
) {
    body_ = std::move(body);
    start(http::verb::post, host, port, target, std::move(handler));
}

void RestClient::start(
    http::verb method,
    std::string_view host,
    std::string_view port,
    std::string_view target,
    ResponseHandler handler
) {
    method_ = method;
    host_ = std::string(host);
    port_ = std::string(port);
    target_ = std::string(target);
    handler_ = std::move(handler);

    // The target may carry credentials (bot tokens); log the host only
    spdlog::debug("REST {} https://{}:{}", std::string(http::to_string(method_)), host_, port_);

    do_resolve();
}

void RestClient::do_resolve() {
    resolver_.async_resolve(
        host_,
        port_,
        [self = shared_from_this()](auto ec, auto results) {
            self->on_resolve(ec, results);
        }
    );
}

void RestClient::on_resolve(boost::system::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
        return fail("resolve", ec);
    }

    // Create a new SSL stream
    stream_ = std::make_unique<ssl_stream>(ioc_, *ssl_ctx_);

    if (!set_sni_hostname(stream_->native_handle(), host_.c_str())) {
        boost::system::error_code ssl_ec{
            static_cast<int>(::ERR_get_error()),
            boost::asio::error::get_ssl_category()
        };
        return fail("ssl_sni", ssl_ec);
    }
    stream_->set_verify_callback(boost::asio::ssl::host_name_verification(host_));

    do_connect(results.begin()->endpoint());
}

void RestClient::do_connect(tcp::resolver::results_type::endpoint_type ep) {
    stream_->next_layer().async_connect(
        ep,
        [self = shared_from_this()](auto ec) {
            self->on_connect(ec);
        }
    );
}

void RestClient::on_connect(boost::system::error_code ec) {
    if (ec) {
        return fail("connect", ec);
    }

    do_ssl_handshake();
}

void RestClient::do_ssl_handshake() {
    stream_->async_handshake(
        boost::asio::ssl::stream_base::client,
        [self = shared_from_this()](auto ec) {
            self->on_ssl_handshake(ec);
        }
    );
}

void RestClient::on_ssl_handshake(boost::system::error_code ec) {
    if (ec) {
        return fail("ssl_handshake", ec);
    }

    req_ = {};
    req_.method(method_);
    req_.target(target_);
    req_.version(11);
    req_.set(http::field::host, host_);
    req_.set(http::field::user_agent, "optiscan/1.0");
    req_.set(http::field::accept, "application/json");
    if (!api_key_.empty()) {
        req_.set(http::field::authorization, "Bearer " + api_key_);
    }
    if (method_ == http::verb::post) {
        req_.set(http::field::content_type, "application/json");
        req_.body() = body_;
        req_.prepare_payload();
    }

    do_write();
}

void RestClient::do_write() {
    http::async_write(
        *stream_,
        req_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_write(ec, bytes);
        }
    );
}

void RestClient::on_write(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        return fail("write", ec);
    }

    do_read();
}

void RestClient::do_read() {
    http::async_read(
        *stream_,
        buffer_,
        res_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_read(ec, bytes);
        }
    );
}

void RestClient::on_read(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        return fail("read", ec);
    }

    auto status = static_cast<int>(res_.result_int());
    if (status < 200 || status >= 300 || status == 204) {
        HttpError error{status, "HTTP " + std::to_string(status) + ": " + std::string(res_.reason())};
        if (error.is_no_data()) {
            spdlog::debug("REST {} returned no data ({})", host_, status);
        } else {
            spdlog::warn("REST request failed: {}", error.message);
        }
        complete(HttpResult::Err(std::move(error)));
        do_shutdown();
        return;
    }

    spdlog::debug("REST response: {} bytes", res_.body().size());
    complete(HttpResult::Ok(std::move(res_.body())));

    do_shutdown();
}

void RestClient::do_shutdown() {
    stream_->async_shutdown(
        [self = shared_from_this()](auto ec) {
            self->on_shutdown(ec);
        }
    );
}

void RestClient::on_shutdown(boost::system::error_code ec) {
    // SSL shutdown errors are common and can be ignored
    if (ec && ec != boost::asio::error::eof &&
        ec != boost::asio::ssl::error::stream_truncated) {
        spdlog::debug("SSL shutdown: {}", ec.message());
    }
}

void RestClient::fail(const std::string& what, boost::system::error_code ec) {
    spdlog::warn("REST {} error for {}: {}", what, host_, ec.message());
    complete(HttpResult::Err(HttpError{0, what + ": " + ec.message()}));
}

void RestClient::complete(HttpResult result) {
    // Handler fires at most once per request
    if (handler_) {
        auto handler = std::move(handler_);
        handler_ = nullptr;
        handler(std::move(result));
    }
}

HttpResult perform_request(
    const std::shared_ptr<boost::asio::ssl::context>& ssl_ctx,
    const HttpRequest& request
) {
    boost::asio::io_context ioc;
    auto client = std::make_shared<RestClient>(ioc, ssl_ctx);
    if (!request.api_key.empty()) {
        client->set_api_key(request.api_key);
    }

    std::optional<HttpResult> outcome;
    auto handler = [&outcome](HttpResult result) {
        outcome.emplace(std::move(result));
    };

    if (request.body.empty()) {
        client->get(request.host, request.port, request.target, handler);
    } else {
        client->post(request.host, request.port, request.target, request.body, handler);
    }

    // Run until the response arrives (shutdown may continue) or the timeout hits
    auto deadline = std::chrono::steady_clock::now() + request.timeout;
    while (!outcome && !ioc.stopped() && std::chrono::steady_clock::now() < deadline) {
        ioc.run_one_until(deadline);
    }
    ioc.stop();

    if (!outcome) {
        return HttpResult::Err(HttpError{0, "timeout after " +
                                            std::to_string(request.timeout.count()) + "ms"});
    }
    return std::move(*outcome);
}

}  // namespace optiscan::network
