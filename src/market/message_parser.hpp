#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include "market/types.hpp"
#include <string_view>
#include <vector>

namespace optiscan::market {

/// Parser for market-data REST responses
/// Converts raw JSON to typed structs
class MessageParser {
public:
    /// Parse an option chain response: {"data":[{contract}, ...]}
    /// Rows without a usable strike, right or expiration are skipped
    /// @param symbol Underlying the chain was requested for
    /// @param fetched_at Timestamp used for rows without their own
    [[nodiscard]] static Result<std::vector<OptionSnapshot>, Error>
    parse_option_chain(std::string_view json, const Symbol& symbol, Timestamp fetched_at);

    /// Parse a bar series response: {"data":[{"timestamp","volume","price"}, ...]}
    /// Output is sorted by timestamp
    [[nodiscard]] static Result<std::vector<HistoricalBar>, Error>
    parse_bars(std::string_view json);

    /// Normalize "20240119" or "2024-01-19" to "2024-01-19"
    [[nodiscard]] static std::string normalize_expiration(std::string_view text);
};

}  // namespace optiscan::market
