#include "config.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstring>
#include <fstream>
#include <sstream>

namespace {
const char* kDefaultPriceApiUrl = "https://min-api.cryptocompare.com/data/pricemulti";
}

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    
    size_t pos = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(val, &pos);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
    
    if (pos != std::strlen(val)) {
        spdlog::warn("Trailing characters in {}='{}', using default {}", name, val, default_val);
        return default_val;
    }
    return parsed;
}

Config Config::from_env() {
    Config cfg;
    
    cfg.price_api_url = get_env("PRICE_API_URL", kDefaultPriceApiUrl);
    cfg.update_interval_seconds = get_env_int("UPDATE_INTERVAL_SECONDS", 60);
    
    cfg.config_path = get_env("CONFIG_PATH", "config.json");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    
    return cfg;
}

void Config::load_portfolio_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file " + path);
    }
    
    std::stringstream buffer;
    buffer << in.rdbuf();
    load_portfolio(buffer.str());
    
    spdlog::info("Loaded portfolio config from {}", path);
}

void Config::load_portfolio(const std::string& json_text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("Malformed config: ") + e.what());
    }
    
    if (!doc.is_object()) {
        throw ConfigError("Malformed config: expected a JSON object");
    }
    
    try {
        bind_address = doc.at("BindAddress").get<std::string>();
        currency = doc.at("Currency").get<std::string>();
        
        coins.clear();
        for (const auto& coin : doc.at("Coins")) {
            CoinConfig cc;
            cc.name = util::trim(coin.at("Name").get<std::string>());
            cc.amount = coin.value("Amount", 0.0);
            coins.push_back(cc);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid config: ") + e.what());
    }
    
    if (!util::split_host_port(bind_address, listen_addr, listen_port)) {
        throw ConfigError("Invalid BindAddress '" + bind_address + "', expected host:port");
    }
}

std::vector<std::string> Config::symbols() const {
    std::vector<std::string> out;
    out.reserve(coins.size());
    for (const auto& coin : coins) {
        out.push_back(coin.name);
    }
    return out;
}

void Config::validate() const {
    if (currency.empty()) {
        throw ConfigError("Currency is required");
    }
    if (coins.empty()) {
        throw ConfigError("At least one entry in Coins is required");
    }
    for (const auto& coin : coins) {
        if (coin.name.empty()) {
            throw ConfigError("Coin Name must not be empty");
        }
    }
    if (listen_port < 1 || listen_port > 65535) {
        throw ConfigError("BindAddress port out of range: " + bind_address);
    }
    if (update_interval_seconds <= 0) {
        throw ConfigError("UPDATE_INTERVAL_SECONDS must be positive");
    }
    if (price_api_url.empty()) {
        throw ConfigError("PRICE_API_URL is required");
    }
    
    spdlog::info("Configuration validated successfully");
    spdlog::info("  Bind address: {}", bind_address);
    spdlog::info("  Currency: {}, {} coins", currency, coins.size());
    spdlog::info("  Update interval: {}s", update_interval_seconds);
}
