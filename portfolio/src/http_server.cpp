#include "http_server.hpp"
#include <spdlog/spdlog.h>

std::string format_total(double total) {
    return fmt::format("{:.2f}", total);
}

HttpServer::HttpServer(const Config& config,
                       std::shared_ptr<PortfolioValuator> valuator,
                       std::shared_ptr<MetricsRegistry> registry,
                       std::shared_ptr<HealthCheck> health)
    : config_(config)
    , valuator_(valuator)
    , registry_(registry)
    , health_(health)
    , server_(std::make_unique<httplib::Server>())
{
    setup_routes();
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::bind() {
    if (!server_->bind_to_port(config_.listen_addr, config_.listen_port)) {
        spdlog::error("Failed to bind HTTP server on {}:{}",
                      config_.listen_addr, config_.listen_port);
        return false;
    }
    spdlog::info("Bound HTTP server to {}:{}", config_.listen_addr, config_.listen_port);
    return true;
}

void HttpServer::start() {
    if (running_) return;
    
    running_ = true;
    
    server_thread_ = std::thread([this]() {
        spdlog::info("Starting HTTP server on {}", config_.bind_address);
        if (!server_->listen_after_bind()) {
            spdlog::error("HTTP server on {} stopped listening", config_.bind_address);
        }
    });
}

void HttpServer::stop() {
    if (!running_) return;
    
    running_ = false;
    server_->wait_until_ready();
    server_->stop();
    
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    
    spdlog::info("HTTP server stopped");
}

void HttpServer::setup_routes() {
    server_->Get("/",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_total(req, res);
        });
    
    server_->Get("/metrics",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_metrics(req, res);
        });
    
    server_->Get("/health",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_health(req, res);
        });
}

void HttpServer::handle_total(const httplib::Request&, httplib::Response& res) const {
    res.set_content(format_total(valuator_->total()), "text/plain");
    res.status = 200;
}

void HttpServer::handle_metrics(const httplib::Request&, httplib::Response& res) const {
    res.set_content(registry_->serialize(), "text/plain; version=0.0.4");
    res.status = 200;
}

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) const {
    auto status = health_->get_status();
    res.set_content(status.dump(), "application/json");
    res.status = health_->is_healthy() ? 200 : 503;
}
