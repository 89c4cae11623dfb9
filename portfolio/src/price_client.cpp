#include "price_client.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

PriceClient::PriceClient(const std::string& api_url)
    : api_url_(api_url)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL for price client");
    }
    
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, header_callback);
}

PriceClient::~PriceClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t PriceClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

size_t PriceClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    std::string line(buffer, size * nitems);
    if (line.rfind("HTTP/", 0) == 0) {
        *static_cast<std::string*>(userp) = line;
    }
    return size * nitems;
}

std::string PriceClient::escape(const std::string& value) const {
    char* escaped = curl_easy_escape(curl_, value.c_str(), static_cast<int>(value.length()));
    if (!escaped) {
        throw FetchError("Failed to URL-encode '" + value + "'");
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

std::string PriceClient::build_url(const std::vector<std::string>& symbols,
                                   const std::string& currency) const {
    std::string url = api_url_;
    url += (url.find('?') == std::string::npos) ? "?" : "&";
    url += "fsyms=" + escape(util::join(symbols, ","));
    url += "&tsyms=" + escape(currency);
    return url;
}

std::string PriceClient::status_text(const std::string& status_line) {
    std::string line = util::trim(status_line);
    auto space = line.find(' ');
    if (space == std::string::npos) return line;
    return util::trim(line.substr(space + 1));
}

PriceTable PriceClient::fetch_prices(const std::vector<std::string>& symbols,
                                     const std::string& currency) {
    std::string url = build_url(symbols, currency);
    std::string response_string;
    std::string status_line;
    
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &status_line);
    
    spdlog::debug("GET {}", url);
    CURLcode res = curl_easy_perform(curl_);
    
    if (res != CURLE_OK) {
        throw FetchError(std::string("Price request failed: ") + curl_easy_strerror(res));
    }
    
    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    
    if (status > 299) {
        std::string text = status_line.empty() ? std::to_string(status) : status_text(status_line);
        throw FetchError("Bad status: " + text);
    }
    
    return parse_price_table(response_string);
}

PriceTable PriceClient::parse_price_table(const std::string& body) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw FetchError(std::string("Failed to parse price response: ") + e.what());
    }
    
    if (!doc.is_object()) {
        throw FetchError("Unexpected price response: expected an object, got " +
                         std::string(doc.type_name()));
    }
    
    PriceTable table;
    for (const auto& [base, quotes] : doc.items()) {
        if (!quotes.is_object()) {
            throw FetchError("Unexpected price response: '" + base + "' is not an object");
        }
        
        auto& row = table[base];
        for (const auto& [quote, price] : quotes.items()) {
            if (!price.is_number()) {
                throw FetchError("Unexpected price response: " + base + "/" + quote +
                                 " is not a number");
            }
            row[quote] = price.get<double>();
        }
    }
    
    return table;
}
