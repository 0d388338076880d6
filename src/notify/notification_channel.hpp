#pragma once

#include "output/report_formatter.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace optiscan::notify {

/// Destination for pre-formatted alert and leaderboard text
class NotificationChannel {
public:
    virtual ~NotificationChannel() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Markup the channel renders
    [[nodiscard]] virtual output::Markup markup() const noexcept { return output::Markup::Plain; }

    /// Deliver text; failures are logged by the channel
    /// @return true when delivered
    virtual bool send(const std::string& text) = 0;
};

/// Zero or more channels; empty means notifications are off
using ChannelList = std::vector<std::shared_ptr<NotificationChannel>>;

}  // namespace optiscan::notify
