#include "notify/telegram_channel.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace optiscan::notify {

namespace {

bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/// Longest prefix of text[pos, pos + max_length) ending on a code point boundary
std::size_t code_point_cut(const std::string& text, std::size_t pos, std::size_t max_length) {
    std::size_t len = max_length;
    while (len > 0 && is_utf8_continuation(text[pos + len])) {
        --len;
    }
    if (len == 0) {
        // Limit smaller than one code point; keep the whole code point
        len = 1;
        while (pos + len < text.size() && is_utf8_continuation(text[pos + len])) {
            ++len;
        }
    }
    return len;
}

}  // namespace

TelegramChannel::TelegramChannel(
    Config::Notify config,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
    std::chrono::milliseconds timeout
)
    : config_(std::move(config))
    , ssl_ctx_(std::move(ssl_ctx))
    , timeout_(timeout)
{}

std::string TelegramChannel::request_body(const std::string& text) const {
    return nlohmann::json{
        {"chat_id", config_.telegram_chat_id},
        {"text", text},
        {"parse_mode", "HTML"},
        {"disable_web_page_preview", true}
    }.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::vector<std::string> TelegramChannel::split_message(const std::string& text, std::size_t max_length) {
    std::vector<std::string> chunks;
    if (max_length == 0) {
        return chunks;
    }

    std::size_t pos = 0;
    while (pos < text.size()) {
        if (text.size() - pos <= max_length) {
            chunks.push_back(text.substr(pos));
            break;
        }

        auto cut = text.rfind('\n', pos + max_length - 1);
        if (cut == std::string::npos || cut <= pos) {
            // No line break in range; hard split between code points
            auto len = code_point_cut(text, pos, max_length);
            chunks.push_back(text.substr(pos, len));
            pos += len;
        } else {
            chunks.push_back(text.substr(pos, cut - pos));
            pos = cut + 1;
        }
    }
    return chunks;
}

bool TelegramChannel::send(const std::string& text) {
    if (!config_.telegram_enabled()) {
        spdlog::warn("Telegram channel not configured; dropping message");
        return false;
    }

    bool delivered = true;
    for (const auto& chunk : split_message(text)) {
        network::HttpRequest request{
            .host = config_.telegram_host,
            .port = "443",
            .target = "/bot" + config_.telegram_token + "/sendMessage",
            .body = request_body(chunk),
            .api_key = {},
            .timeout = timeout_,
        };

        auto result = network::perform_request(ssl_ctx_, request);
        if (result.is_err()) {
            // Never log the target: it contains the bot token
            spdlog::error("Telegram send failed: {}", result.error().message);
            delivered = false;
        }
    }
    return delivered;
}

}  // namespace optiscan::notify
