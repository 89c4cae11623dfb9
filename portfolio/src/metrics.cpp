#include "metrics.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <cmath>
#include <sstream>

namespace {

const char* kNamespace = "portfolio_metrics";
const char* kGaugeHelp = "Ticker for a specific crypto";

std::string format_sample_value(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "+Inf" : "-Inf";
    return fmt::format("{}", value);
}

std::string escape_help(const std::string& help) {
    std::string out;
    for (char c : help) {
        if (c == '\\') {
            out += "\\\\";
        } else if (c == '\n') {
            out += "\\n";
        } else {
            out += c;
        }
    }
    return out;
}
    
} // namespace

std::string metric_name_part(const std::string& symbol) {
    std::string out = util::to_lower(symbol);
    for (auto& c : out) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_') {
            c = '_';
        }
    }
    return out;
}

Gauge::Gauge(std::string fq_name, std::string help)
    : fq_name_(std::move(fq_name))
    , help_(std::move(help))
{}

std::string MetricsRegistry::build_fq_name(const std::string& ns,
                                           const std::string& subsystem,
                                           const std::string& name) {
    std::vector<std::string> parts;
    for (const auto* part : {&ns, &subsystem, &name}) {
        if (!part->empty()) parts.push_back(*part);
    }
    return util::join(parts, "_");
}

bool MetricsRegistry::is_valid_metric_name(const std::string& name) {
    if (name.empty()) return false;
    
    for (size_t i = 0; i < name.size(); i++) {
        unsigned char c = static_cast<unsigned char>(name[i]);
        bool ok = std::isalpha(c) || c == '_' || c == ':' || (i > 0 && std::isdigit(c));
        if (!ok) return false;
    }
    return true;
}

std::shared_ptr<Gauge> MetricsRegistry::register_gauge(const GaugeOpts& opts) {
    std::string fq_name = build_fq_name(opts.ns, opts.subsystem, opts.name);
    
    if (!is_valid_metric_name(fq_name)) {
        throw RegistrationError("Invalid metric name '" + fq_name + "'");
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    
    for (const auto& existing : gauges_) {
        if (existing->fq_name() == fq_name) {
            throw RegistrationError("Duplicate metrics collector registration attempted: " + fq_name);
        }
    }
    
    auto gauge = std::make_shared<Gauge>(fq_name, opts.help);
    gauges_.push_back(gauge);
    
    spdlog::debug("Registered gauge {}", fq_name);
    return gauge;
}

std::string MetricsRegistry::serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::ostringstream oss;
    for (const auto& gauge : gauges_) {
        oss << "# HELP " << gauge->fq_name() << " " << escape_help(gauge->help()) << "\n";
        oss << "# TYPE " << gauge->fq_name() << " gauge\n";
        oss << gauge->fq_name() << " " << format_sample_value(gauge->value()) << "\n";
    }
    return oss.str();
}

size_t MetricsRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gauges_.size();
}

GaugeSet prepare_gauges(MetricsRegistry& registry,
                        const std::vector<std::string>& symbols,
                        const std::string& currency) {
    GaugeSet gauges;
    
    for (const auto& coin : symbols) {
        std::string symbol = util::to_lower(coin);
        
        GaugeOpts opts;
        opts.ns = kNamespace;
        opts.subsystem = metric_name_part(coin);
        opts.name = metric_name_part(currency);
        opts.help = kGaugeHelp;
        
        gauges[symbol] = registry.register_gauge(opts);
    }
    
    spdlog::info("Prepared {} gauges", gauges.size());
    return gauges;
}
