// include/quant_engine/signal/signal_generator.hpp
#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "quant_engine/core/config_base.hpp"
#include "quant_engine/core/types.hpp"
#include "quant_engine/data/market_data.hpp"
#include "quant_engine/factor/factor_combination.hpp"

namespace quant_engine {

enum class SignalType { BUY, SELL, HOLD };

inline std::string signal_type_to_string(SignalType type) {
    switch (type) {
        case SignalType::BUY:
            return "BUY";
        case SignalType::SELL:
            return "SELL";
        case SignalType::HOLD:
            return "HOLD";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Trading decision derived from one snapshot
 */
struct TradingSignal {
    std::string stock_code;
    Timestamp timestamp;
    SignalType signal_type{SignalType::HOLD};
    double strength{0.0};         // [0, 1], zero for HOLD
    double position_size{0.0};    // Fraction of cash to commit, zero for HOLD
    double confidence{0.0};       // [0, 1]
    double composite_score{0.0};  // [-1, 1]
    std::unordered_map<std::string, double> factor_scores;
    std::string reason;
};

/**
 * @brief Thresholds turning composite scores into signals
 */
struct SignalThresholds : public ConfigBase {
    double buy_threshold{0.6};
    double sell_threshold{-0.6};
    double min_strength{0.1};         // Weaker signals become HOLD at generation
    double max_position_size{1.0};
    double filter_min_confidence{0.3};  // apply_filters: below this, HOLD
    double filter_min_strength{0.2};    // apply_filters: weaker BUY/SELL become HOLD

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["buy_threshold"] = buy_threshold;
        j["sell_threshold"] = sell_threshold;
        j["min_strength"] = min_strength;
        j["max_position_size"] = max_position_size;
        j["filter_min_confidence"] = filter_min_confidence;
        j["filter_min_strength"] = filter_min_strength;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("buy_threshold"))
            buy_threshold = j.at("buy_threshold").get<double>();
        if (j.contains("sell_threshold"))
            sell_threshold = j.at("sell_threshold").get<double>();
        if (j.contains("min_strength"))
            min_strength = j.at("min_strength").get<double>();
        if (j.contains("max_position_size"))
            max_position_size = j.at("max_position_size").get<double>();
        if (j.contains("filter_min_confidence"))
            filter_min_confidence = j.at("filter_min_confidence").get<double>();
        if (j.contains("filter_min_strength"))
            filter_min_strength = j.at("filter_min_strength").get<double>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }

    /**
     * @brief Check threshold ordering and ranges
     */
    Result<void> validate() const override;
};

/**
 * @brief Risk-scaled sizing applied after filtering
 */
struct PositionSizingConfig : public ConfigBase {
    double max_position{1.0};
    double min_confidence{0.3};
    double risk_multiplier{1.0};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["max_position"] = max_position;
        j["min_confidence"] = min_confidence;
        j["risk_multiplier"] = risk_multiplier;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("max_position"))
            max_position = j.at("max_position").get<double>();
        if (j.contains("min_confidence"))
            min_confidence = j.at("min_confidence").get<double>();
        if (j.contains("risk_multiplier"))
            risk_multiplier = j.at("risk_multiplier").get<double>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Converts weighted factor readings into BUY/SELL/HOLD decisions
 *
 * Each factor value is squashed with tanh to [-1, 1]. The composite score is
 * the weighted mean over the configured factors present in the snapshot;
 * absent factors are left out of both the sum and the weight total.
 */
class SignalGenerator {
public:
    explicit SignalGenerator(SignalThresholds thresholds = SignalThresholds{});

    /**
     * @brief Map a raw factor value to [-1, 1]
     */
    static double normalize(double raw_value);

    /**
     * @brief Normalized score of every active factor present in the data
     */
    std::unordered_map<std::string, double> factor_scores(
        const std::unordered_map<std::string, double>& factor_data,
        const FactorCombination& combination) const;

    /**
     * @brief Weighted composite of the present factors, 0 when none is present
     */
    double score(const std::unordered_map<std::string, double>& factor_data,
                 const FactorCombination& combination) const;

    /**
     * @brief Generate a signal with the generator's own thresholds
     */
    TradingSignal generate(const DataSnapshot& snapshot,
                           const FactorCombination& combination) const;

    /**
     * @brief Generate a signal
     * @param snapshot Day being scored
     * @param combination Factor weights
     * @param thresholds Thresholds to apply, overriding the generator's own
     * @param stock_code Stock the signal refers to
     * @param timestamp Time the signal refers to
     */
    TradingSignal generate(const DataSnapshot& snapshot, const FactorCombination& combination,
                           const SignalThresholds& thresholds, const std::string& stock_code,
                           const Timestamp& timestamp) const;

    std::vector<TradingSignal> generate_batch(const std::vector<DataSnapshot>& snapshots,
                                              const FactorCombination& combination) const;

    /**
     * @brief Downgrade low-confidence or weak signals to HOLD
     *
     * Confidence, composite score and factor scores are kept for audit.
     */
    TradingSignal apply_filters(const TradingSignal& signal) const;

    /**
     * @brief Position size scaled by confidence and the risk multiplier
     * @return Fraction in [0, max_position], zero for HOLD or low confidence
     */
    double calculate_position_size(const TradingSignal& signal,
                                   const PositionSizingConfig& sizing) const;

    const SignalThresholds& thresholds() const {
        return thresholds_;
    }

private:
    double calculate_confidence(const std::unordered_map<std::string, double>& scores,
                                size_t expected_factors, double composite_score) const;

    SignalThresholds thresholds_;
};

}  // namespace quant_engine
