// include/quant_engine/factor/factor_combination.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "quant_engine/core/error.hpp"

namespace quant_engine {

/**
 * @brief Family a factor belongs to
 */
enum class FactorType { TECHNICAL, FUNDAMENTAL, MARKET, SENTIMENT, MACRO };

std::string factor_type_to_string(FactorType type);

/**
 * @brief Parse a factor type name ("technical", "fundamental", ...)
 */
Result<FactorType> factor_type_from_string(const std::string& name);

/**
 * @brief A single weighted factor inside a combination
 */
struct FactorConfig {
    std::string name;
    FactorType type{FactorType::TECHNICAL};
    double weight{0.0};
    bool is_active{true};
    std::string description;
    nlohmann::json parameters = nlohmann::json::object();  // Calculator-specific settings

    nlohmann::json to_json() const;
    static Result<FactorConfig> from_json(const nlohmann::json& j);
};

/**
 * @brief Errors and warnings found when checking a combination
 */
struct FactorValidationReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    bool is_valid() const {
        return errors.empty();
    }
};

/**
 * @brief Weighted set of factors used to score snapshots
 *
 * create() and from_json() enforce unique names, weights in [0,1] and active
 * weights summing to 1 within WEIGHT_TOLERANCE. A default-constructed combination
 * is empty and scores every snapshot as neutral.
 */
class FactorCombination {
public:
    static constexpr double WEIGHT_TOLERANCE = 1e-3;

    FactorCombination() = default;

    /**
     * @brief Build and validate a combination
     * @param id Persistent identifier
     * @param name Display name, must be non-empty
     * @param factors Factor list
     * @param description Optional free text
     * @return The combination, or VALIDATION_ERROR naming the first violated rule
     */
    static Result<FactorCombination> create(std::string id, std::string name,
                                            std::vector<FactorConfig> factors,
                                            std::string description = "");

    /**
     * @brief Check a factor list without building a combination
     */
    static FactorValidationReport validate(const std::string& name,
                                           const std::vector<FactorConfig>& factors);

    /**
     * @brief Validation report for this combination, including warnings
     */
    FactorValidationReport validate() const;

    /**
     * @brief Rescale active weights so they sum to 1
     *
     * When every active weight is zero the active factors share the weight equally.
     */
    void normalize_weights();

    const std::string& id() const {
        return id_;
    }
    const std::string& name() const {
        return name_;
    }
    const std::string& description() const {
        return description_;
    }
    const std::vector<FactorConfig>& factors() const {
        return factors_;
    }

    std::vector<FactorConfig> active_factors() const;
    std::vector<std::string> factor_names() const;
    std::map<FactorType, std::vector<FactorConfig>> factors_by_type() const;

    /**
     * @brief Sum of the weights of active factors
     */
    double total_weight() const;

    nlohmann::json to_json() const;
    static Result<FactorCombination> from_json(const nlohmann::json& j);

    /**
     * @brief Single moving-average factor used when a task names no combination
     */
    static FactorCombination default_combination();

private:
    FactorCombination(std::string id, std::string name, std::vector<FactorConfig> factors,
                      std::string description);

    std::string id_;
    std::string name_;
    std::string description_;
    std::vector<FactorConfig> factors_;
};

/**
 * @brief Lookup of stored factor combinations
 */
class FactorCombinationStore {
public:
    virtual ~FactorCombinationStore() = default;

    /**
     * @brief Fetch a combination by id
     * @return The combination, DATA_NOT_FOUND if unknown
     */
    virtual Result<FactorCombination> get_combination(const std::string& id) = 0;

    virtual Result<void> save_combination(const FactorCombination& combination) = 0;
};

}  // namespace quant_engine
