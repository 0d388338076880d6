#include "market/types.hpp"
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace optiscan::market {

std::optional<OptionType> parse_option_type(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "call" || lower == "c") {
        return OptionType::Call;
    }
    if (lower == "put" || lower == "p") {
        return OptionType::Put;
    }
    return std::nullopt;
}

std::string ContractKey::to_string() const {
    std::ostringstream oss;
    oss << symbol << ' ' << market::to_string(option_type) << ' '
        << std::fixed << std::setprecision(2) << strike << ' ' << expiration;
    return oss.str();
}

std::size_t ContractKeyHash::operator()(const ContractKey& key) const noexcept {
    // Strikes are quoted in cents; hash the rounded value so 450.0 and 450.00 agree
    auto strike_cents = static_cast<long long>(std::llround(key.strike * 100.0));

    std::size_t seed = std::hash<std::string>{}(key.symbol);
    auto combine = [&seed](std::size_t h) {
        seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    };
    combine(std::hash<int>{}(static_cast<int>(key.option_type)));
    combine(std::hash<long long>{}(strike_cents));
    combine(std::hash<std::string>{}(key.expiration));
    return seed;
}

}  // namespace optiscan::market
