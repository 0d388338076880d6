#include "notify/console_channel.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace optiscan::notify {

bool ConsoleChannel::send(const std::string& text) {
    // One log record per line keeps the pattern prefix on each
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty()) {
            spdlog::warn("{}", line);
        }
    }
    ++sent_;
    return true;
}

}  // namespace optiscan::notify
