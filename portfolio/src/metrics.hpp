#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

class RegistrationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct GaugeOpts {
    std::string ns;
    std::string subsystem;
    std::string name;
    std::string help;
};

class Gauge {
public:
    Gauge(std::string fq_name, std::string help);
    
    void set(double value) { value_.store(value); }
    double value() const { return value_.load(); }
    
    const std::string& fq_name() const { return fq_name_; }
    const std::string& help() const { return help_; }

private:
    std::string fq_name_;
    std::string help_;
    std::atomic<double> value_{0.0};
};

/**
 * Process-wide gauge registry rendered in the Prometheus text format (0.0.4).
 *
 * Registration happens at startup only. A second registration of the same
 * fully-qualified name throws RegistrationError.
 */
class MetricsRegistry {
public:
    std::shared_ptr<Gauge> register_gauge(const GaugeOpts& opts);
    
    std::string serialize() const;
    size_t size() const;
    
    // Joins the non-empty parts with '_', e.g. portfolio_metrics_btc_usd
    static std::string build_fq_name(const std::string& ns,
                                     const std::string& subsystem,
                                     const std::string& name);
    static bool is_valid_metric_name(const std::string& name);

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Gauge>> gauges_;
};

// Lowercases and maps anything outside [a-z0-9_] to '_': "USDC.e" -> "usdc_e"
std::string metric_name_part(const std::string& symbol);

// Lowercase asset symbol -> gauge
using GaugeSet = std::map<std::string, std::shared_ptr<Gauge>>;

GaugeSet prepare_gauges(MetricsRegistry& registry,
                        const std::vector<std::string>& symbols,
                        const std::string& currency);
