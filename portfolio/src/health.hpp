#pragma once

#include "valuation.hpp"
#include <nlohmann/json.hpp>
#include <memory>

class HealthCheck {
public:
    explicit HealthCheck(std::shared_ptr<PortfolioValuator> valuator);
    
    nlohmann::json get_status() const;
    bool is_healthy() const;

private:
    std::shared_ptr<PortfolioValuator> valuator_;
};
