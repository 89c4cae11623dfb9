#pragma once

#include <string>
#include <vector>
#include <cstdlib>
#include <stdexcept>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CoinConfig {
    std::string name;
    double amount;
};

struct Config {
    // Portfolio (config file)
    std::string bind_address;
    std::string currency;
    std::vector<CoinConfig> coins;
    
    // HTTP, derived from bind_address
    std::string listen_addr;
    int listen_port = 0;
    
    // Pricing API
    std::string price_api_url;
    int update_interval_seconds = 60;
    
    // Service
    std::string config_path;
    std::string log_level;
    
    static Config from_env();
    
    void load_portfolio_file(const std::string& path);
    void load_portfolio(const std::string& json_text);
    
    std::vector<std::string> symbols() const;
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
