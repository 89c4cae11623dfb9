#include <catch2/catch_test_macros.hpp>
#include "../src/valuation.hpp"
#include <memory>

namespace {

class FakePriceSource : public PriceSource {
public:
    PriceTable table;
    bool fail = false;
    int calls = 0;
    std::vector<std::string> last_symbols;
    std::string last_currency;
    
    PriceTable fetch_prices(const std::vector<std::string>& symbols,
                            const std::string& currency) override {
        calls++;
        last_symbols = symbols;
        last_currency = currency;
        if (fail) {
            throw FetchError("Bad status: 500 Internal Server Error");
        }
        return table;
    }
};
    
} // namespace

TEST_CASE("Portfolio valuation", "[valuation]") {
    MetricsRegistry registry;
    std::vector<CoinConfig> coins = {{"BTC", 2.0}, {"ETH", 10.0}};
    auto gauges = prepare_gauges(registry, {"BTC", "ETH"}, "USD");
    auto source = std::make_shared<FakePriceSource>();
    PortfolioValuator valuator(coins, "USD", source, gauges);
    
    SECTION("Total is the sum of price times amount") {
        source->table = {{"BTC", {{"USD", 50000.0}}}, {"ETH", {{"USD", 3000.0}}}};
        
        REQUIRE(valuator.update());
        REQUIRE(valuator.total() == 130000.0);
        std::vector<std::string> expected_symbols = {"BTC", "ETH"};
        REQUIRE(source->last_symbols == expected_symbols);
        REQUIRE(source->last_currency == "USD");
    }
    
    SECTION("Gauges carry each asset's price") {
        source->table = {{"BTC", {{"USD", 50000.0}}}, {"ETH", {{"USD", 3000.0}}}};
        
        REQUIRE(valuator.update());
        REQUIRE(gauges["btc"]->value() == 50000.0);
        REQUIRE(gauges["eth"]->value() == 3000.0);
    }
    
    SECTION("Quote currency is matched case-insensitively") {
        source->table = {{"BTC", {{"usd", 50000.0}, {"EUR", 46000.0}}},
                         {"ETH", {{"Usd", 3000.0}, {"EUR", 2800.0}}}};
        
        REQUIRE(valuator.update());
        REQUIRE(valuator.total() == 130000.0);
    }
    
    SECTION("Held symbol missing from the price table contributes zero") {
        source->table = {{"BTC", {{"USD", 50000.0}}}};
        
        REQUIRE(valuator.update());
        REQUIRE(valuator.total() == 100000.0);
        REQUIRE(gauges["eth"]->value() == 0.0);
    }
    
    SECTION("Priced symbol that is not held contributes zero") {
        source->table = {{"BTC", {{"USD", 50000.0}}}, {"DOGE", {{"USD", 0.1}}}};
        
        REQUIRE(valuator.update());
        REQUIRE(valuator.total() == 100000.0);
    }
    
    SECTION("Fetch failure leaves total and gauges unchanged") {
        source->table = {{"BTC", {{"USD", 50000.0}}}, {"ETH", {{"USD", 3000.0}}}};
        REQUIRE(valuator.update());
        
        source->fail = true;
        REQUIRE_FALSE(valuator.update());
        
        REQUIRE(valuator.total() == 130000.0);
        REQUIRE(gauges["btc"]->value() == 50000.0);
        REQUIRE(gauges["eth"]->value() == 3000.0);
        REQUIRE(valuator.cycles_ok() == 1);
        REQUIRE(valuator.cycles_failed() == 1);
    }
    
    SECTION("Consecutive cycles with unchanged prices give the same total") {
        source->table = {{"BTC", {{"USD", 50000.0}}}, {"ETH", {{"USD", 3000.0}}}};
        
        REQUIRE(valuator.update());
        double first = valuator.total();
        REQUIRE(valuator.update());
        
        REQUIRE(valuator.total() == first);
        REQUIRE(source->calls == 2);
    }
    
    SECTION("No successful cycle yet") {
        REQUIRE(valuator.total() == 0.0);
        REQUIRE_FALSE(valuator.last_update_ms().has_value());
    }
}

TEST_CASE("Fetch failure before any successful cycle", "[valuation]") {
    MetricsRegistry registry;
    auto gauges = prepare_gauges(registry, {"BTC"}, "USD");
    auto source = std::make_shared<FakePriceSource>();
    source->fail = true;
    PortfolioValuator valuator({{"BTC", 1.0}}, "USD", source, gauges);
    
    REQUIRE_FALSE(valuator.update());
    REQUIRE(valuator.total() == 0.0);
    REQUIRE(gauges["btc"]->value() == 0.0);
    REQUIRE_FALSE(valuator.last_update_ms().has_value());
}

TEST_CASE("Zero and negative amounts", "[valuation]") {
    MetricsRegistry registry;
    auto gauges = prepare_gauges(registry, {"BTC", "ETH"}, "USD");
    auto source = std::make_shared<FakePriceSource>();
    source->table = {{"BTC", {{"USD", 50000.0}}}, {"ETH", {{"USD", 3000.0}}}};
    PortfolioValuator valuator({{"BTC", 0.0}, {"ETH", -1.0}}, "USD", source, gauges);
    
    REQUIRE(valuator.update());
    REQUIRE(valuator.total() == -3000.0);
}

TEST_CASE("Held amount lookup", "[valuation]") {
    auto source = std::make_shared<FakePriceSource>();
    PortfolioValuator valuator({{"BTC", 1.5}}, "USD", source, GaugeSet{});
    
    REQUIRE(valuator.held_amount("BTC") == 1.5);
    REQUIRE(valuator.held_amount("btc") == 1.5);
    REQUIRE(valuator.held_amount("ETH") == 0.0);
}

TEST_CASE("Valuing a price table without gauges", "[valuation]") {
    auto source = std::make_shared<FakePriceSource>();
    PortfolioValuator valuator({{"BTC", 2.0}}, "EUR", source, GaugeSet{});
    
    auto result = valuator.value_portfolio({{"BTC", {{"USD", 50000.0}, {"EUR", 45000.0}}}});
    
    REQUIRE(result.total == 90000.0);
    REQUIRE(result.prices.size() == 1);
    REQUIRE(result.prices.at("btc") == 45000.0);
}
