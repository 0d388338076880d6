#include "market/message_parser.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace optiscan::market {

using json = nlohmann::json;

namespace {

/// Numeric field that may arrive as a number or a numeric string
/// Throws std::invalid_argument when the value is not a finite number
double number_field(const json& obj, const char* key, double fallback = 0.0) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }

    double value = fallback;
    if (it->is_number()) {
        value = it->get<double>();
    } else if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        if (text.empty()) {
            return fallback;
        }
        char* end = nullptr;
        value = std::strtod(text.c_str(), &end);
        if (end == text.c_str() || *end != '\0') {
            throw std::invalid_argument(std::string(key) + " is not a number: " + text);
        }
    } else {
        return fallback;
    }

    if (!std::isfinite(value)) {
        throw std::invalid_argument(std::string(key) + " is not finite");
    }
    return value;
}

/// Non-negative integer field (contract counts)
Contracts count_field(const json& obj, const char* key) {
    double value = number_field(obj, key);
    if (value < 0.0 || value >= static_cast<double>(std::numeric_limits<Contracts>::max())) {
        throw std::out_of_range(std::string(key) + " out of range");
    }
    return static_cast<Contracts>(value);
}

/// Epoch milliseconds; zero when absent
std::int64_t epoch_ms_field(const json& obj, const char* key) {
    double value = number_field(obj, key);
    if (value < 0.0 || value >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
        throw std::out_of_range(std::string(key) + " out of range");
    }
    return static_cast<std::int64_t>(value);
}

std::string text_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<std::int64_t>());
    }
    return {};
}

/// Locate the "data" array, or fail with a Parse error
Result<json, Error> data_array(std::string_view json_str) {
    auto j = json::parse(json_str);
    if (!j.is_object() || !j.contains("data")) {
        return Result<json, Error>::Err(Error::parse("Missing \"data\" field"));
    }
    auto data = j["data"];
    if (data.is_null()) {
        return Result<json, Error>::Ok(json::array());
    }
    if (!data.is_array()) {
        return Result<json, Error>::Err(Error::parse("\"data\" is not an array"));
    }
    return Result<json, Error>::Ok(std::move(data));
}

std::optional<Greeks> parse_greeks(const json& row) {
    auto it = row.find("greeks");
    if (it == row.end() || !it->is_object()) {
        return std::nullopt;
    }
    return Greeks{
        .implied_volatility = number_field(*it, "implied_volatility"),
        .delta = number_field(*it, "delta"),
        .gamma = number_field(*it, "gamma"),
        .theta = number_field(*it, "theta"),
        .vega = number_field(*it, "vega"),
    };
}

}  // namespace

std::string MessageParser::normalize_expiration(std::string_view text) {
    if (text.size() == 8 &&
        std::all_of(text.begin(), text.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        })) {
        std::string out;
        out.reserve(10);
        out.append(text.substr(0, 4)).push_back('-');
        out.append(text.substr(4, 2)).push_back('-');
        out.append(text.substr(6, 2));
        return out;
    }
    return std::string(text);
}

Result<std::vector<OptionSnapshot>, Error> MessageParser::parse_option_chain(
    std::string_view json_str,
    const Symbol& symbol,
    Timestamp fetched_at
) {
    try {
        auto data = data_array(json_str);
        if (data.is_err()) {
            return Result<std::vector<OptionSnapshot>, Error>::Err(data.error());
        }

        std::vector<OptionSnapshot> chain;
        chain.reserve(data.value().size());
        std::size_t skipped = 0;

        for (const auto& row : data.value()) {
            if (!row.is_object()) {
                ++skipped;
                continue;
            }

            // A bad cell costs its row only
            try {
                auto right = text_field(row, "option_type");
                if (right.empty()) {
                    right = text_field(row, "right");
                }
                auto option_type = parse_option_type(right);
                auto expiration = normalize_expiration(text_field(row, "expiration"));
                double strike = number_field(row, "strike");

                if (!option_type || expiration.empty() || strike <= 0.0) {
                    ++skipped;
                    continue;
                }

                OptionSnapshot snap;
                snap.symbol = symbol;
                snap.option_type = *option_type;
                snap.strike = strike;
                snap.expiration = std::move(expiration);
                snap.bid = number_field(row, "bid");
                snap.ask = number_field(row, "ask");
                double last = number_field(row, "last");
                snap.price = last > 0.0 ? last : (snap.bid + snap.ask) / 2.0;
                snap.volume = count_field(row, "volume");
                snap.open_interest = count_field(row, "open_interest");
                snap.underlying_price = number_field(row, "underlying_price");
                snap.greeks = parse_greeks(row);

                auto ts = epoch_ms_field(row, "timestamp");
                snap.timestamp = ts > 0 ? convert::from_epoch_ms(ts) : fetched_at;

                chain.push_back(std::move(snap));
            } catch (const std::exception& e) {
                ++skipped;
                spdlog::debug("Bad chain row for {}: {}", symbol, e.what());
            }
        }

        if (skipped > 0) {
            spdlog::debug("Skipped {} malformed chain rows for {}", skipped, symbol);
        }

        return Result<std::vector<OptionSnapshot>, Error>::Ok(std::move(chain));

    } catch (const json::exception& e) {
        return Result<std::vector<OptionSnapshot>, Error>::Err(
            Error::parse(std::string("JSON parse error: ") + e.what())
        );
    } catch (const std::exception& e) {
        return Result<std::vector<OptionSnapshot>, Error>::Err(
            Error::parse(std::string("Parse error: ") + e.what())
        );
    }
}

Result<std::vector<HistoricalBar>, Error> MessageParser::parse_bars(std::string_view json_str) {
    try {
        auto data = data_array(json_str);
        if (data.is_err()) {
            return Result<std::vector<HistoricalBar>, Error>::Err(data.error());
        }

        std::vector<HistoricalBar> bars;
        bars.reserve(data.value().size());

        std::size_t skipped = 0;
        for (const auto& row : data.value()) {
            if (!row.is_object() || !row.contains("timestamp")) {
                continue;
            }
            try {
                bars.push_back(HistoricalBar{
                    .timestamp = convert::from_epoch_ms(epoch_ms_field(row, "timestamp")),
                    .volume = number_field(row, "volume"),
                    .price = number_field(row, "price"),
                });
            } catch (const std::exception& e) {
                ++skipped;
                spdlog::debug("Bad bar row: {}", e.what());
            }
        }
        if (skipped > 0) {
            spdlog::debug("Skipped {} malformed bar rows", skipped);
        }

        std::stable_sort(bars.begin(), bars.end(), [](const auto& a, const auto& b) {
            return a.timestamp < b.timestamp;
        });

        return Result<std::vector<HistoricalBar>, Error>::Ok(std::move(bars));

    } catch (const json::exception& e) {
        return Result<std::vector<HistoricalBar>, Error>::Err(
            Error::parse(std::string("JSON parse error: ") + e.what())
        );
    } catch (const std::exception& e) {
        return Result<std::vector<HistoricalBar>, Error>::Err(
            Error::parse(std::string("Parse error: ") + e.what())
        );
    }
}

}  // namespace optiscan::market
