// src/factor/factor_combination.cpp

#include "quant_engine/factor/factor_combination.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>
#include <sstream>

namespace quant_engine {

namespace {
constexpr double DOMINANT_WEIGHT = 0.8;
}

std::string factor_type_to_string(FactorType type) {
    switch (type) {
        case FactorType::TECHNICAL:
            return "technical";
        case FactorType::FUNDAMENTAL:
            return "fundamental";
        case FactorType::MARKET:
            return "market";
        case FactorType::SENTIMENT:
            return "sentiment";
        case FactorType::MACRO:
            return "macro";
        default:
            return "unknown";
    }
}

Result<FactorType> factor_type_from_string(const std::string& name) {
    if (name == "technical")
        return FactorType::TECHNICAL;
    if (name == "fundamental")
        return FactorType::FUNDAMENTAL;
    if (name == "market")
        return FactorType::MARKET;
    if (name == "sentiment")
        return FactorType::SENTIMENT;
    if (name == "macro")
        return FactorType::MACRO;
    return make_error<FactorType>(ErrorCode::VALIDATION_ERROR, "Unknown factor type: " + name,
                                  "FactorCombination");
}

nlohmann::json FactorConfig::to_json() const {
    nlohmann::json j;
    j["factor_name"] = name;
    j["factor_type"] = factor_type_to_string(type);
    j["weight"] = weight;
    j["is_active"] = is_active;
    j["description"] = description;
    j["parameters"] = parameters;
    return j;
}

Result<FactorConfig> FactorConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("factor_name") || !j.contains("factor_type") ||
        !j.contains("weight")) {
        return make_error<FactorConfig>(ErrorCode::VALIDATION_ERROR,
                                        "Factor entry requires factor_name, factor_type and weight",
                                        "FactorCombination");
    }

    try {
        FactorConfig config;
        config.name = j.at("factor_name").get<std::string>();

        auto type_result = factor_type_from_string(j.at("factor_type").get<std::string>());
        if (type_result.is_error()) {
            return forward_error<FactorConfig>(type_result);
        }
        config.type = type_result.value();
        config.weight = j.at("weight").get<double>();

        if (j.contains("is_active"))
            config.is_active = j.at("is_active").get<bool>();
        if (j.contains("description") && j.at("description").is_string())
            config.description = j.at("description").get<std::string>();
        if (j.contains("parameters") && j.at("parameters").is_object())
            config.parameters = j.at("parameters");

        return config;
    } catch (const nlohmann::json::exception& e) {
        return make_error<FactorConfig>(ErrorCode::JSON_PARSE_ERROR,
                                        std::string("Malformed factor entry: ") + e.what(),
                                        "FactorCombination");
    }
}

FactorCombination::FactorCombination(std::string id, std::string name,
                                     std::vector<FactorConfig> factors, std::string description)
    : id_(std::move(id)),
      name_(std::move(name)),
      description_(std::move(description)),
      factors_(std::move(factors)) {}

Result<FactorCombination> FactorCombination::create(std::string id, std::string name,
                                                    std::vector<FactorConfig> factors,
                                                    std::string description) {
    auto report = validate(name, factors);
    if (!report.is_valid()) {
        return make_error<FactorCombination>(ErrorCode::VALIDATION_ERROR, report.errors.front(),
                                             "FactorCombination");
    }
    return FactorCombination(std::move(id), std::move(name), std::move(factors),
                             std::move(description));
}

FactorValidationReport FactorCombination::validate(const std::string& name,
                                                   const std::vector<FactorConfig>& factors) {
    FactorValidationReport report;

    if (name.empty()) {
        report.errors.push_back("Combination name must not be empty");
    }
    if (factors.empty()) {
        report.errors.push_back("Combination must contain at least one factor");
        return report;
    }

    std::set<std::string> seen;
    std::set<FactorType> types;
    double active_total = 0.0;
    size_t active_count = 0;

    for (const auto& factor : factors) {
        if (factor.name.empty()) {
            report.errors.push_back("Factor name must not be empty");
        } else if (!seen.insert(factor.name).second) {
            report.errors.push_back("Duplicate factor name: " + factor.name);
        }

        if (!std::isfinite(factor.weight) || factor.weight < 0.0 || factor.weight > 1.0) {
            std::ostringstream os;
            os << "Weight of factor " << factor.name << " must be within [0, 1], got "
               << factor.weight;
            report.errors.push_back(os.str());
        }

        if (factor.is_active) {
            active_total += factor.weight;
            ++active_count;
            types.insert(factor.type);
            if (factor.weight == 0.0) {
                report.warnings.push_back("Factor " + factor.name + " has zero weight");
            }
            if (factor.weight > DOMINANT_WEIGHT) {
                report.warnings.push_back("Factor " + factor.name +
                                          " dominates the combination");
            }
        } else {
            report.warnings.push_back("Factor " + factor.name + " is inactive");
        }
    }

    if (active_count == 0) {
        report.errors.push_back("Combination must contain at least one active factor");
    } else if (std::abs(active_total - 1.0) > WEIGHT_TOLERANCE) {
        std::ostringstream os;
        os << "Active factor weights must sum to 1.0, got " << active_total;
        report.errors.push_back(os.str());
    }

    if (types.size() == 1 && active_count > 1) {
        report.warnings.push_back("All active factors are of type " +
                                  factor_type_to_string(*types.begin()));
    }

    return report;
}

FactorValidationReport FactorCombination::validate() const {
    return validate(name_, factors_);
}

void FactorCombination::normalize_weights() {
    double total = total_weight();
    size_t active_count = static_cast<size_t>(std::count_if(
        factors_.begin(), factors_.end(), [](const FactorConfig& f) { return f.is_active; }));
    if (active_count == 0) {
        return;
    }

    for (auto& factor : factors_) {
        if (!factor.is_active) {
            continue;
        }
        factor.weight = total > 0.0 ? factor.weight / total : 1.0 / active_count;
    }
}

std::vector<FactorConfig> FactorCombination::active_factors() const {
    std::vector<FactorConfig> active;
    std::copy_if(factors_.begin(), factors_.end(), std::back_inserter(active),
                 [](const FactorConfig& f) { return f.is_active; });
    return active;
}

std::vector<std::string> FactorCombination::factor_names() const {
    std::vector<std::string> names;
    for (const auto& factor : factors_) {
        if (factor.is_active) {
            names.push_back(factor.name);
        }
    }
    return names;
}

std::map<FactorType, std::vector<FactorConfig>> FactorCombination::factors_by_type() const {
    std::map<FactorType, std::vector<FactorConfig>> grouped;
    for (const auto& factor : factors_) {
        if (factor.is_active) {
            grouped[factor.type].push_back(factor);
        }
    }
    return grouped;
}

double FactorCombination::total_weight() const {
    double total = 0.0;
    for (const auto& factor : factors_) {
        if (factor.is_active) {
            total += factor.weight;
        }
    }
    return total;
}

nlohmann::json FactorCombination::to_json() const {
    nlohmann::json j;
    j["id"] = id_;
    j["name"] = name_;
    j["description"] = description_;
    j["total_weight"] = total_weight();
    j["factors"] = nlohmann::json::array();
    for (const auto& factor : factors_) {
        j["factors"].push_back(factor.to_json());
    }
    return j;
}

Result<FactorCombination> FactorCombination::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("factors") || !j.at("factors").is_array()) {
        return make_error<FactorCombination>(ErrorCode::VALIDATION_ERROR,
                                             "Combination requires a factors array",
                                             "FactorCombination");
    }

    std::vector<FactorConfig> factors;
    for (const auto& entry : j.at("factors")) {
        auto factor = FactorConfig::from_json(entry);
        if (factor.is_error()) {
            return forward_error<FactorCombination>(factor);
        }
        factors.push_back(factor.value());
    }

    std::string id = j.contains("id") ? j.at("id").get<std::string>() : "";
    std::string name = j.contains("name") ? j.at("name").get<std::string>() : "";
    std::string description = j.contains("description") && j.at("description").is_string()
                                  ? j.at("description").get<std::string>()
                                  : "";
    return create(std::move(id), std::move(name), std::move(factors), std::move(description));
}

FactorCombination FactorCombination::default_combination() {
    FactorConfig ma;
    ma.name = "ma_signal";
    ma.type = FactorType::TECHNICAL;
    ma.weight = 1.0;
    ma.description = "Moving average crossover signal";
    ma.parameters = {{"short_window", 5}, {"long_window", 20}};
    return FactorCombination("default", "Default technical", {ma},
                             "Fallback used when a task names no combination");
}

}  // namespace quant_engine
