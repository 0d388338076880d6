#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>
#include <string>

namespace optiscan::network {

/// Create a shared SSL context configured for TLS client connections
/// Shared by the market-data client and the Telegram channel
/// @param ca_bundle Optional PEM file used instead of the system store
[[nodiscard]] std::shared_ptr<boost::asio::ssl::context> create_ssl_context(
    const std::string& ca_bundle = {}
);

}  // namespace optiscan::network
