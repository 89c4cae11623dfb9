#include "valuation.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

PortfolioValuator::PortfolioValuator(std::vector<CoinConfig> coins,
                                     std::string currency,
                                     std::shared_ptr<PriceSource> price_source,
                                     GaugeSet gauges)
    : coins_(std::move(coins))
    , currency_(std::move(currency))
    , price_source_(std::move(price_source))
    , gauges_(std::move(gauges))
{
    for (const auto& coin : coins_) {
        symbols_.push_back(coin.name);
    }
}

double PortfolioValuator::held_amount(const std::string& symbol) const {
    for (const auto& coin : coins_) {
        if (util::iequals(coin.name, symbol)) {
            return coin.amount;
        }
    }
    return 0.0;
}

ValuationResult PortfolioValuator::value_portfolio(const PriceTable& prices) const {
    ValuationResult result;
    result.total = 0.0;
    
    for (const auto& [base, quotes] : prices) {
        for (const auto& [quote, price] : quotes) {
            if (!util::iequals(quote, currency_)) {
                continue;
            }
            
            double amount = held_amount(base);
            double subtotal = price * amount;
            
            result.prices[util::to_lower(base)] = price;
            result.total += subtotal;
            
            spdlog::debug("{}: {} x {} {} = {:.2f}", base, amount, price, quote, subtotal);
        }
    }
    
    return result;
}

bool PortfolioValuator::update() {
    spdlog::info("Updating portfolio...");
    
    try {
        auto prices = price_source_->fetch_prices(symbols_, currency_);
        auto result = value_portfolio(prices);
        
        // Gauges carry the per-asset price; the sum only goes to the total.
        for (const auto& [symbol, price] : result.prices) {
            auto it = gauges_.find(symbol);
            if (it == gauges_.end()) {
                spdlog::warn("No gauge registered for {}, not publishing its price", symbol);
                continue;
            }
            it->second->set(price);
        }
        
        total_.store(result.total);
        last_update_ms_.store(util::current_timestamp_ms());
        cycles_ok_++;
        
        spdlog::info("Portfolio total: {:.2f} {}", result.total, currency_);
        return true;
        
    } catch (const std::exception& e) {
        cycles_failed_++;
        spdlog::error("Portfolio update failed: {}", e.what());
        return false;
    }
}

std::optional<int64_t> PortfolioValuator::last_update_ms() const {
    int64_t ts = last_update_ms_.load();
    if (ts == 0) return std::nullopt;
    return ts;
}
