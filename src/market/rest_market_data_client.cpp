#include "market/rest_market_data_client.hpp"
#include "market/message_parser.hpp"
#include "network/retry_backoff.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <thread>

namespace optiscan::market {

namespace {

std::string format_strike(Price strike) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << strike;
    return oss.str();
}

std::string time_range_query(Timestamp start, Timestamp end, std::chrono::minutes granularity) {
    auto ivl = std::chrono::duration_cast<std::chrono::milliseconds>(granularity).count();
    return "&start=" + std::to_string(convert::to_epoch_ms(start)) +
           "&end=" + std::to_string(convert::to_epoch_ms(end)) +
           "&ivl=" + std::to_string(ivl);
}

}  // namespace

RestMarketDataClient::RestMarketDataClient(
    Config::MarketData config,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx
)
    : config_(std::move(config))
    , ssl_ctx_(std::move(ssl_ctx))
{}

std::string RestMarketDataClient::url_encode(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", uc);
            out.append(buf);
        }
    }
    return out;
}

Result<std::string, Error> RestMarketDataClient::fetch(const std::string& target) const {
    network::HttpRequest request{
        .host = config_.host,
        .port = config_.port,
        .target = config_.base_path + target,
        .body = {},
        .api_key = config_.api_key,
        .timeout = config_.request_timeout,
    };

    network::RetryBackoff backoff(config_);

    while (true) {
        auto result = network::perform_request(ssl_ctx_, request);
        if (result.is_ok()) {
            return Result<std::string, Error>::Ok(std::move(result).take_value());
        }

        const auto& err = result.error();
        if (err.is_no_data()) {
            return Result<std::string, Error>::Err(
                Error::data_unavailable("No data for " + request.target)
            );
        }
        if (!err.is_transient()) {
            // Client errors (auth, bad request) are not worth repeating
            return Result<std::string, Error>::Err(
                Error::transient(err.message + " for " + request.target)
            );
        }
        if (!backoff.can_retry()) {
            return Result<std::string, Error>::Err(Error::transient(
                err.message + " for " + request.target + " after " +
                std::to_string(backoff.retry_count()) + " retries"
            ));
        }

        auto delay = backoff.next_delay();
        spdlog::debug("Retrying {} in {}ms (attempt {})",
                      request.target, delay.count(), backoff.retry_count());
        std::this_thread::sleep_for(delay);
    }
}

Result<std::vector<OptionSnapshot>, Error> RestMarketDataClient::get_option_chain(const Symbol& symbol) {
    auto fetched_at = std::chrono::system_clock::now();
    auto body = fetch("/options/chain?root=" + url_encode(symbol));
    if (body.is_err()) {
        return Result<std::vector<OptionSnapshot>, Error>::Err(body.error());
    }

    auto chain = MessageParser::parse_option_chain(body.value(), symbol, fetched_at);
    if (chain.is_ok() && chain.value().empty()) {
        return Result<std::vector<OptionSnapshot>, Error>::Err(
            Error::data_unavailable("Empty option chain for " + symbol)
        );
    }
    return chain;
}

Result<std::vector<HistoricalBar>, Error> RestMarketDataClient::fetch_bars(
    const std::string& target,
    const std::string& what
) const {
    auto body = fetch(target);
    if (body.is_err()) {
        return Result<std::vector<HistoricalBar>, Error>::Err(body.error());
    }

    auto bars = MessageParser::parse_bars(body.value());
    if (bars.is_ok() && bars.value().empty()) {
        return Result<std::vector<HistoricalBar>, Error>::Err(
            Error::data_unavailable("No bars for " + what)
        );
    }
    return bars;
}

Result<std::vector<HistoricalBar>, Error> RestMarketDataClient::get_historical_bars(
    const ContractKey& contract,
    Timestamp start,
    Timestamp end,
    std::chrono::minutes granularity
) {
    auto target = "/options/bars?root=" + url_encode(contract.symbol) +
                  "&right=" + std::string(to_string(contract.option_type)) +
                  "&strike=" + format_strike(contract.strike) +
                  "&expiration=" + url_encode(contract.expiration) +
                  time_range_query(start, end, granularity);
    return fetch_bars(target, contract.to_string());
}

Result<std::vector<HistoricalBar>, Error> RestMarketDataClient::get_underlying_bars(
    const Symbol& symbol,
    Timestamp start,
    Timestamp end,
    std::chrono::minutes granularity
) {
    auto target = "/stocks/bars?root=" + url_encode(symbol) +
                  time_range_query(start, end, granularity);
    return fetch_bars(target, symbol);
}

}  // namespace optiscan::market
