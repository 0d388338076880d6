#include "detect/opportunity.hpp"

namespace optiscan::detect {

Opportunity make_opportunity(
    const Symbol& symbol,
    const market::OptionSnapshot& snapshot,
    std::string_view alert_type,
    std::string_view strategy
) {
    Opportunity opp;
    opp.contract = snapshot.key();
    if (!symbol.empty()) {
        opp.contract.symbol = symbol;
    }
    opp.detected_at = snapshot.timestamp;
    opp.price = snapshot.price;
    opp.volume = snapshot.volume;
    opp.open_interest = snapshot.open_interest;
    opp.notional_value = snapshot.notional_value();
    opp.underlying_price = snapshot.underlying_price;
    opp.greeks = snapshot.greeks;
    opp.alert_type = std::string(alert_type);
    opp.strategy = std::string(strategy);
    return opp;
}

}  // namespace optiscan::detect
