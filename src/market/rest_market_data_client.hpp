#pragma once

#include "core/config.hpp"
#include "market/market_data_client.hpp"
#include "network/rest_client.hpp"
#include <boost/asio/ssl/context.hpp>
#include <memory>
#include <string>

namespace optiscan::market {

/// Market-data client over the provider's HTTPS/JSON API
///
/// Each call performs a blocking request on the calling thread, retrying
/// transient failures with exponential backoff. Thread-safe.
class RestMarketDataClient final : public MarketDataClient {
public:
    RestMarketDataClient(
        Config::MarketData config,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx
    );

    [[nodiscard]] Result<std::vector<OptionSnapshot>, Error>
    get_option_chain(const Symbol& symbol) override;

    [[nodiscard]] Result<std::vector<HistoricalBar>, Error>
    get_historical_bars(
        const ContractKey& contract,
        Timestamp start,
        Timestamp end,
        std::chrono::minutes granularity
    ) override;

    [[nodiscard]] Result<std::vector<HistoricalBar>, Error>
    get_underlying_bars(
        const Symbol& symbol,
        Timestamp start,
        Timestamp end,
        std::chrono::minutes granularity
    ) override;

    /// Percent-encode a query parameter value
    [[nodiscard]] static std::string url_encode(std::string_view value);

private:
    /// GET with retries; maps HTTP failures onto the error taxonomy
    [[nodiscard]] Result<std::string, Error> fetch(const std::string& target) const;

    [[nodiscard]] Result<std::vector<HistoricalBar>, Error>
    fetch_bars(const std::string& target, const std::string& what) const;

    Config::MarketData config_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
};

}  // namespace optiscan::market
