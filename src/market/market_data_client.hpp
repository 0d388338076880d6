#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include "market/types.hpp"
#include <chrono>
#include <vector>

namespace optiscan::market {

/// Source of option chains and historical bars
///
/// Implementations are called concurrently from scan and backtest workers
/// and must be thread-safe. A missing series is reported as
/// ErrorKind::DataUnavailable, distinct from ErrorKind::TransientFetch.
class MarketDataClient {
public:
    virtual ~MarketDataClient() = default;

    /// Current option chain for an underlying
    [[nodiscard]] virtual Result<std::vector<OptionSnapshot>, Error>
    get_option_chain(const Symbol& symbol) = 0;

    /// Bars for one contract in [start, end], oldest first
    [[nodiscard]] virtual Result<std::vector<HistoricalBar>, Error>
    get_historical_bars(
        const ContractKey& contract,
        Timestamp start,
        Timestamp end,
        std::chrono::minutes granularity
    ) = 0;

    /// Bars for the underlying in [start, end], oldest first
    [[nodiscard]] virtual Result<std::vector<HistoricalBar>, Error>
    get_underlying_bars(
        const Symbol& symbol,
        Timestamp start,
        Timestamp end,
        std::chrono::minutes granularity
    ) = 0;
};

}  // namespace optiscan::market
