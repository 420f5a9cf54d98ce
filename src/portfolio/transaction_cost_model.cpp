// src/portfolio/transaction_cost_model.cpp

#include "quant_engine/portfolio/transaction_cost_model.hpp"
#include <algorithm>
#include <cmath>

namespace quant_engine {

Result<void> TransactionCostConfig::validate() const {
    for (double rate : {commission_rate, stamp_tax_rate, transfer_fee_rate, slippage_rate}) {
        if (!std::isfinite(rate) || rate < 0.0 || rate > 1.0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Transaction cost rates must be within [0, 1]",
                                    "TransactionCostConfig");
        }
    }
    if (min_commission < 0.0 || min_transfer_fee < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Minimum fees must not be negative", "TransactionCostConfig");
    }
    return Result<void>();
}

TransactionCostModel::TransactionCostModel(TransactionCostConfig config)
    : config_(std::move(config)) {}

TransactionCost TransactionCostModel::calculate(Side side, double shares, double price) const {
    TransactionCost cost;
    double notional = std::abs(shares) * price;
    if (notional <= 0.0) {
        return cost;
    }

    cost.commission = std::max(notional * config_.commission_rate, config_.min_commission);
    cost.stamp_tax = side == Side::SELL ? notional * config_.stamp_tax_rate : 0.0;
    cost.transfer_fee = std::max(notional * config_.transfer_fee_rate, config_.min_transfer_fee);
    cost.slippage = notional * config_.slippage_rate;
    cost.total = cost.commission + cost.stamp_tax + cost.transfer_fee + cost.slippage;
    return cost;
}

}  // namespace quant_engine
