#pragma once

#include <string>
#include <vector>
#include <map>
#include <stdexcept>
#include <curl/curl.h>

// Base symbol -> quote symbol -> price
using PriceTable = std::map<std::string, std::map<std::string, double>>;

class FetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class PriceSource {
public:
    virtual ~PriceSource() = default;
    
    // Throws FetchError on transport, status or decode failure.
    virtual PriceTable fetch_prices(const std::vector<std::string>& symbols,
                                    const std::string& currency) = 0;
};

/**
 * Single-attempt client for a pricemulti-style endpoint:
 *   GET <api_url>?fsyms=BTC,ETH&tsyms=USD -> {"BTC":{"USD":1.0},"ETH":{"USD":2.0}}
 *
 * Not thread-safe; the update cycle is its only caller.
 */
class PriceClient : public PriceSource {
public:
    explicit PriceClient(const std::string& api_url);
    ~PriceClient() override;
    
    // Disable copy
    PriceClient(const PriceClient&) = delete;
    PriceClient& operator=(const PriceClient&) = delete;
    
    PriceTable fetch_prices(const std::vector<std::string>& symbols,
                            const std::string& currency) override;
    
    std::string build_url(const std::vector<std::string>& symbols,
                          const std::string& currency) const;
    
    static PriceTable parse_price_table(const std::string& body);
    
    // "HTTP/1.1 500 Internal Server Error\r\n" -> "500 Internal Server Error"
    static std::string status_text(const std::string& status_line);

private:
    std::string api_url_;
    CURL* curl_;
    
    std::string escape(const std::string& value) const;
    
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
};
