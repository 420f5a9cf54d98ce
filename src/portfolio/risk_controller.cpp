// src/portfolio/risk_controller.cpp

#include "quant_engine/portfolio/risk_controller.hpp"
#include <cmath>

namespace quant_engine {

Result<void> RiskConfig::validate() const {
    if (!std::isfinite(max_position_ratio) || max_position_ratio <= 0.0 ||
        max_position_ratio > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_position_ratio must be within (0, 1]", "RiskConfig");
    }
    if (!std::isfinite(stop_loss_ratio) || stop_loss_ratio < 0.0 || stop_loss_ratio >= 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "stop_loss_ratio must be within [0, 1)", "RiskConfig");
    }
    return Result<void>();
}

RiskController::RiskController(RiskConfig config, TransactionCostModel cost_model)
    : config_(std::move(config)), cost_model_(std::move(cost_model)) {}

bool RiskController::is_stop_loss_triggered(const PortfolioPosition& position,
                                            double price) const {
    if (position.shares <= 0.0 || position.avg_cost <= 0.0) {
        return false;
    }
    return price <= position.avg_cost * (1.0 - config_.stop_loss_ratio);
}

RiskDecision RiskController::apply(const TradingSignal& signal,
                                   const PortfolioPosition* position, double price,
                                   double cash) const {
    RiskDecision decision;
    decision.signal = signal;
    TradingSignal& adjusted = decision.signal;

    if (adjusted.position_size > config_.max_position_ratio) {
        adjusted.position_size = config_.max_position_ratio;
        decision.position_capped = true;
    }

    if (position && is_stop_loss_triggered(*position, price)) {
        adjusted.signal_type = SignalType::SELL;
        adjusted.position_size = 1.0;
        adjusted.strength = 1.0;
        adjusted.reason += " risk:stop_loss";
        decision.stop_loss_triggered = true;
        return decision;
    }

    if (adjusted.signal_type == SignalType::BUY) {
        double cost_factor = 1.0 + cost_model_.estimate_buy_cost_rate();
        double estimated_cost = cash * adjusted.position_size * cost_factor;
        if (estimated_cost > cash) {
            adjusted.position_size = 1.0 / cost_factor;
            adjusted.reason += " risk:scaled_for_cash";
            decision.scaled_for_cash = true;
        }
    }

    return decision;
}

}  // namespace quant_engine
