#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace optiscan::market {

enum class OptionType {
    Call,
    Put
};

[[nodiscard]] constexpr std::string_view to_string(OptionType type) noexcept {
    return type == OptionType::Call ? "call" : "put";
}

/// Parse "call"/"put"/"C"/"P" (case-insensitive)
[[nodiscard]] std::optional<OptionType> parse_option_type(std::string_view text);

/// Contract identity: underlying, right, strike and expiration (YYYY-MM-DD)
struct ContractKey {
    Symbol symbol;
    OptionType option_type{OptionType::Call};
    Price strike{0.0};
    std::string expiration;

    [[nodiscard]] bool operator==(const ContractKey& other) const = default;

    /// "SPY call 450.00 2024-01-19"
    [[nodiscard]] std::string to_string() const;
};

struct ContractKeyHash {
    [[nodiscard]] std::size_t operator()(const ContractKey& key) const noexcept;
};

/// Option Greeks as reported by the data provider
struct Greeks {
    double implied_volatility{0.0};
    double delta{0.0};
    double gamma{0.0};
    double theta{0.0};
    double vega{0.0};
};

/// One contract row of an option chain, immutable for a scan cycle
struct OptionSnapshot {
    Symbol symbol;
    OptionType option_type{OptionType::Call};
    Price strike{0.0};
    std::string expiration;
    Price price{0.0};       // last trade, or mid when no last
    Price bid{0.0};
    Price ask{0.0};
    Contracts volume{0};
    Contracts open_interest{0};
    std::optional<Greeks> greeks;
    Price underlying_price{0.0};
    Timestamp timestamp{};

    [[nodiscard]] ContractKey key() const {
        return ContractKey{symbol, option_type, strike, expiration};
    }

    [[nodiscard]] double notional_value() const {
        return convert::notional(price, volume);
    }

    [[nodiscard]] double implied_volatility() const {
        return greeks ? greeks->implied_volatility : 0.0;
    }
};

/// Historical bar for a contract or an underlying
struct HistoricalBar {
    Timestamp timestamp{};
    double volume{0.0};
    Price price{0.0};
};

}  // namespace optiscan::market
