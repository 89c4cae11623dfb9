#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace util {

std::string current_iso8601() {
    return iso8601_from_ms(current_timestamp_ms());
}

std::string iso8601_from_ms(int64_t timestamp_ms) {
    std::time_t itt = static_cast<std::time_t>(timestamp_ms / 1000);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string trim(const std::string& str) {
    auto first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    auto last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return std::equal(a.begin(), a.end(), b.begin(),
                      [](unsigned char x, unsigned char y) {
                          return std::tolower(x) == std::tolower(y);
                      });
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

bool split_host_port(const std::string& address, std::string& host, int& port) {
    auto colon = address.rfind(':');
    if (colon == std::string::npos) return false;
    
    std::string host_part = address.substr(0, colon);
    std::string port_part = address.substr(colon + 1);
    
    if (host_part.size() >= 2 && host_part.front() == '[' && host_part.back() == ']') {
        host_part = host_part.substr(1, host_part.size() - 2);
    }
    
    if (port_part.empty() ||
        !std::all_of(port_part.begin(), port_part.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    
    int parsed = 0;
    try {
        parsed = std::stoi(port_part);
    } catch (const std::exception&) {
        return false;
    }
    
    host = host_part.empty() ? "0.0.0.0" : host_part;
    port = parsed;
    return true;
}
    
} // namespace util
