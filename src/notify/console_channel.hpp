#pragma once

#include "notify/notification_channel.hpp"
#include <atomic>
#include <cstddef>

namespace optiscan::notify {

/// Writes notifications to the log at warn level so they stand out
class ConsoleChannel final : public NotificationChannel {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "console"; }

    bool send(const std::string& text) override;

    [[nodiscard]] std::size_t sent_count() const noexcept { return sent_.load(); }

private:
    std::atomic<std::size_t> sent_{0};
};

}  // namespace optiscan::notify
