#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    std::string iso8601_from_ms(int64_t timestamp_ms);
    int64_t current_timestamp_ms();
    std::string trim(const std::string& str);
    std::string to_lower(const std::string& str);
    bool iequals(const std::string& a, const std::string& b);
    std::string join(const std::vector<std::string>& parts, const std::string& sep);
    
    // Splits "host:port", "[v6]:port" or ":port". An empty host becomes 0.0.0.0.
    bool split_host_port(const std::string& address, std::string& host, int& port);
}
