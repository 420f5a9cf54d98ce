// include/quant_engine/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "quant_engine/core/error.hpp"

namespace quant_engine {

/**
 * @brief Base of every configuration section
 *
 * Sections read only the keys present in the JSON, so a partial document
 * overrides defaults field by field.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write to_json() as indented JSON
     * @return FILE_IO_ERROR when the file cannot be opened
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Read a JSON file, apply it through from_json() and validate the result
     * @return FILE_NOT_FOUND, JSON_PARSE_ERROR for malformed text, UNKNOWN_ERROR
     *         when a value has the wrong type, or the error of validate()
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    /**
     * @brief Parse and apply a JSON document held in memory
     */
    Result<void> load_from_string(const std::string& text);

    virtual nlohmann::json to_json() const = 0;
    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Range checks of the section; sections without constraints accept anything
     */
    virtual Result<void> validate() const {
        return Result<void>();
    }

protected:
    Result<void> apply(const nlohmann::json& j);
};

}  // namespace quant_engine
