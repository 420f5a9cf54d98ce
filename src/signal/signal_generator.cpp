// src/signal/signal_generator.cpp

#include "quant_engine/signal/signal_generator.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace quant_engine {

namespace {

constexpr double COMPLETENESS_WEIGHT = 0.3;
constexpr double CONSISTENCY_WEIGHT = 0.4;
constexpr double MAGNITUDE_WEIGHT = 0.3;

bool within(double value, double low, double high) {
    return std::isfinite(value) && value >= low && value <= high;
}

void make_hold(TradingSignal& signal) {
    signal.signal_type = SignalType::HOLD;
    signal.strength = 0.0;
    signal.position_size = 0.0;
}

}  // namespace

Result<void> SignalThresholds::validate() const {
    if (!within(buy_threshold, -1.0, 1.0) || !within(sell_threshold, -1.0, 1.0)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Signal thresholds must be within [-1, 1]", "SignalThresholds");
    }
    if (buy_threshold <= sell_threshold) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Buy threshold must be greater than sell threshold",
                                "SignalThresholds");
    }
    if (!within(min_strength, 0.0, 1.0) || !within(filter_min_strength, 0.0, 1.0) ||
        !within(filter_min_confidence, 0.0, 1.0)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Strength and confidence floors must be within [0, 1]",
                                "SignalThresholds");
    }
    if (!within(max_position_size, 0.0, 1.0) || max_position_size == 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Maximum position size must be within (0, 1]",
                                "SignalThresholds");
    }
    return Result<void>();
}

SignalGenerator::SignalGenerator(SignalThresholds thresholds)
    : thresholds_(std::move(thresholds)) {}

double SignalGenerator::normalize(double raw_value) {
    return std::tanh(raw_value);
}

std::unordered_map<std::string, double> SignalGenerator::factor_scores(
    const std::unordered_map<std::string, double>& factor_data,
    const FactorCombination& combination) const {
    std::unordered_map<std::string, double> scores;
    for (const auto& factor : combination.factors()) {
        if (!factor.is_active) {
            continue;
        }
        auto it = factor_data.find(factor.name);
        if (it == factor_data.end() || !std::isfinite(it->second)) {
            continue;
        }
        scores[factor.name] = normalize(it->second);
    }
    return scores;
}

double SignalGenerator::score(const std::unordered_map<std::string, double>& factor_data,
                              const FactorCombination& combination) const {
    auto scores = factor_scores(factor_data, combination);

    double weighted_sum = 0.0;
    double weight_total = 0.0;
    for (const auto& factor : combination.factors()) {
        auto it = scores.find(factor.name);
        if (!factor.is_active || it == scores.end()) {
            continue;
        }
        weighted_sum += it->second * factor.weight;
        weight_total += factor.weight;
    }

    if (weight_total <= 0.0) {
        return 0.0;
    }
    return std::clamp(weighted_sum / weight_total, -1.0, 1.0);
}

TradingSignal SignalGenerator::generate(const DataSnapshot& snapshot,
                                        const FactorCombination& combination) const {
    return generate(snapshot, combination, thresholds_, snapshot.stock_code, snapshot.timestamp);
}

TradingSignal SignalGenerator::generate(const DataSnapshot& snapshot,
                                        const FactorCombination& combination,
                                        const SignalThresholds& thresholds,
                                        const std::string& stock_code,
                                        const Timestamp& timestamp) const {
    TradingSignal signal;
    signal.stock_code = stock_code;
    signal.timestamp = timestamp;
    signal.factor_scores = factor_scores(snapshot.factor_data, combination);
    signal.composite_score = score(snapshot.factor_data, combination);

    if (signal.composite_score >= thresholds.buy_threshold) {
        signal.signal_type = SignalType::BUY;
    } else if (signal.composite_score <= thresholds.sell_threshold) {
        signal.signal_type = SignalType::SELL;
    } else {
        signal.signal_type = SignalType::HOLD;
    }

    signal.strength = std::min(std::abs(signal.composite_score), 1.0);
    if (signal.signal_type != SignalType::HOLD && signal.strength < thresholds.min_strength) {
        signal.signal_type = SignalType::HOLD;
    }

    if (signal.signal_type == SignalType::HOLD) {
        make_hold(signal);
    } else {
        signal.position_size = std::min(signal.strength * thresholds.max_position_size,
                                        thresholds.max_position_size);
    }

    signal.confidence = calculate_confidence(
        signal.factor_scores, combination.active_factors().size(), signal.composite_score);

    std::ostringstream reason;
    reason << std::fixed << std::setprecision(3) << "composite=" << signal.composite_score
           << " factors=" << signal.factor_scores.size();
    signal.reason = reason.str();

    return signal;
}

std::vector<TradingSignal> SignalGenerator::generate_batch(
    const std::vector<DataSnapshot>& snapshots, const FactorCombination& combination) const {
    std::vector<TradingSignal> signals;
    signals.reserve(snapshots.size());
    for (const auto& snapshot : snapshots) {
        signals.push_back(generate(snapshot, combination));
    }
    return signals;
}

TradingSignal SignalGenerator::apply_filters(const TradingSignal& signal) const {
    TradingSignal filtered = signal;

    if (filtered.confidence < thresholds_.filter_min_confidence) {
        if (filtered.signal_type != SignalType::HOLD) {
            filtered.reason += " filtered:low_confidence";
        }
        make_hold(filtered);
    } else if (filtered.signal_type != SignalType::HOLD &&
               filtered.strength < thresholds_.filter_min_strength) {
        filtered.reason += " filtered:weak";
        make_hold(filtered);
    }

    return filtered;
}

double SignalGenerator::calculate_position_size(const TradingSignal& signal,
                                                const PositionSizingConfig& sizing) const {
    if (signal.signal_type == SignalType::HOLD || signal.confidence < sizing.min_confidence) {
        return 0.0;
    }

    double size = signal.position_size * signal.confidence * sizing.risk_multiplier;
    return std::clamp(size, 0.0, sizing.max_position);
}

double SignalGenerator::calculate_confidence(const std::unordered_map<std::string, double>& scores,
                                             size_t expected_factors,
                                             double composite_score) const {
    double completeness = 0.0;
    if (expected_factors > 0) {
        completeness =
            std::min(static_cast<double>(scores.size()) / static_cast<double>(expected_factors),
                     1.0);
    }

    size_t positive = 0;
    size_t negative = 0;
    for (const auto& [name, value] : scores) {
        if (value > 0.0) {
            ++positive;
        } else if (value < 0.0) {
            ++negative;
        }
    }
    double consistency = 0.0;
    if (positive + negative > 0) {
        consistency = static_cast<double>(std::max(positive, negative)) /
                      static_cast<double>(positive + negative);
    }

    double magnitude = std::min(std::abs(composite_score), 1.0);

    double confidence = COMPLETENESS_WEIGHT * completeness + CONSISTENCY_WEIGHT * consistency +
                        MAGNITUDE_WEIGHT * magnitude;
    return std::clamp(confidence, 0.0, 1.0);
}

}  // namespace quant_engine
