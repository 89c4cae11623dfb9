#pragma once

#include "config.hpp"
#include "metrics.hpp"
#include "price_client.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ValuationResult {
    double total;
    std::map<std::string, double> prices;   // lowercase symbol -> price in reporting currency
};

/**
 * Runs one portfolio update cycle: fetch prices, value the holdings, publish
 * each asset's price to its gauge and store the grand total.
 *
 * The total is a single-writer atomic; readers never block on a cycle.
 * A failed cycle leaves every gauge and the total as they were.
 */
class PortfolioValuator {
public:
    PortfolioValuator(std::vector<CoinConfig> coins,
                      std::string currency,
                      std::shared_ptr<PriceSource> price_source,
                      GaugeSet gauges);
    
    // Never throws. Returns false if the cycle was skipped.
    bool update();
    
    ValuationResult value_portfolio(const PriceTable& prices) const;
    double held_amount(const std::string& symbol) const;
    
    double total() const { return total_.load(); }
    const std::string& currency() const { return currency_; }
    
    uint64_t cycles_ok() const { return cycles_ok_.load(); }
    uint64_t cycles_failed() const { return cycles_failed_.load(); }
    std::optional<int64_t> last_update_ms() const;

private:
    std::vector<CoinConfig> coins_;
    std::vector<std::string> symbols_;
    std::string currency_;
    std::shared_ptr<PriceSource> price_source_;
    GaugeSet gauges_;
    
    std::atomic<double> total_{0.0};
    std::atomic<uint64_t> cycles_ok_{0};
    std::atomic<uint64_t> cycles_failed_{0};
    std::atomic<int64_t> last_update_ms_{0};
};
