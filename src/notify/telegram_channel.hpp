#pragma once

#include "core/config.hpp"
#include "network/rest_client.hpp"
#include "notify/notification_channel.hpp"
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace optiscan::notify {

/// Telegram Bot API sendMessage with HTML parse mode
class TelegramChannel final : public NotificationChannel {
public:
    /// Bot API limit on message length
    static constexpr std::size_t kMaxMessageLength = 4096;

    TelegramChannel(
        Config::Notify config,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
        std::chrono::milliseconds timeout = std::chrono::milliseconds{10000}
    );

    [[nodiscard]] std::string_view name() const noexcept override { return "telegram"; }
    [[nodiscard]] output::Markup markup() const noexcept override { return output::Markup::Html; }

    /// Long texts go out as several messages split on line breaks
    bool send(const std::string& text) override;

    /// JSON body for one sendMessage call
    [[nodiscard]] std::string request_body(const std::string& text) const;

    /// Split text into chunks of at most max_length, preferring line breaks
    [[nodiscard]] static std::vector<std::string> split_message(
        const std::string& text,
        std::size_t max_length = kMaxMessageLength
    );

private:
    Config::Notify config_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::chrono::milliseconds timeout_;
};

}  // namespace optiscan::notify
