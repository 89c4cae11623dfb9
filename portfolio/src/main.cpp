#include "config.hpp"
#include "metrics.hpp"
#include "price_client.hpp"
#include "valuation.hpp"
#include "scheduler.hpp"
#include "health.hpp"
#include "http_server.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("portfolio_exporter", console_sink);
    
    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }
    
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        if (argc > 1) {
            config->config_path = argv[1];
        }
        setup_logging(config->log_level);
        
        spdlog::info("==============================================");
        spdlog::info("Portfolio Exporter v1.0");
        spdlog::info("==============================================");
        
        config->load_portfolio_file(config->config_path);
        config->validate();
        
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);
        
        // Initialize components
        auto registry = std::make_shared<MetricsRegistry>();
        auto gauges = prepare_gauges(*registry, config->symbols(), config->currency);
        auto prices = std::make_shared<PriceClient>(config->price_api_url);
        auto valuator = std::make_shared<PortfolioValuator>(config->coins, config->currency,
                                                            prices, gauges);
        auto health = std::make_shared<HealthCheck>(valuator);
        
        HttpServer server(*config, valuator, registry, health);
        if (!server.bind()) {
            spdlog::critical("Cannot listen on {}, exiting", config->bind_address);
            return 1;
        }
        
        // First cycle runs before the server accepts requests
        UpdateScheduler scheduler([valuator]() { valuator->update(); },
                                  std::chrono::seconds(config->update_interval_seconds));
        scheduler.start();
        server.start();
        
        spdlog::info("Portfolio exporter started");
        
        // Main loop
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        
        // Shutdown
        spdlog::info("Stopping services...");
        scheduler.stop();
        server.stop();
        
        spdlog::info("Shutdown complete");
        return 0;
        
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
