#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<PortfolioValuator> valuator)
    : valuator_(valuator) {}

nlohmann::json HealthCheck::get_status() const {
    auto last_update = valuator_->last_update_ms();
    
    nlohmann::json status = {
        {"ok", is_healthy()},
        {"last_update", last_update ? nlohmann::json(util::iso8601_from_ms(*last_update))
                                    : nlohmann::json(nullptr)},
        {"cycles_ok", valuator_->cycles_ok()},
        {"cycles_failed", valuator_->cycles_failed()}
    };
    
    return status;
}

bool HealthCheck::is_healthy() const {
    return valuator_->cycles_ok() > 0;
}
