#pragma once

#include "config.hpp"
#include "health.hpp"
#include "metrics.hpp"
#include "valuation.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <string>
#include <thread>

// "%.2f" rendering of the portfolio total
std::string format_total(double total);

/**
 * Serves:
 *   GET /         latest portfolio total as plain text
 *   GET /metrics  Prometheus exposition of the registry
 *   GET /health   cycle status as JSON
 */
class HttpServer {
public:
    HttpServer(const Config& config,
               std::shared_ptr<PortfolioValuator> valuator,
               std::shared_ptr<MetricsRegistry> registry,
               std::shared_ptr<HealthCheck> health);
    ~HttpServer();
    
    // False if the listen address cannot be bound.
    bool bind();
    void start();
    void stop();
    bool is_running() const { return running_; }
    
    void handle_total(const httplib::Request& req, httplib::Response& res) const;
    void handle_metrics(const httplib::Request& req, httplib::Response& res) const;
    void handle_health(const httplib::Request& req, httplib::Response& res) const;

private:
    const Config& config_;
    std::shared_ptr<PortfolioValuator> valuator_;
    std::shared_ptr<MetricsRegistry> registry_;
    std::shared_ptr<HealthCheck> health_;
    
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;
    
    void setup_routes();
};
