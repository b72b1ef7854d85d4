// include/paper_ngin/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "paper_ngin/core/error.hpp"

namespace paper_ngin {

/**
 * @brief Base class for all configuration types
 * Every config round-trips through JSON and can be stored on disk
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write the configuration to a JSON file
     * @param filepath Destination path
     * @return Result indicating success or failure
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Read the configuration from a JSON file
     * Keys missing from the file keep their current values
     * @param filepath Source path
     * @return Result indicating success or failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace paper_ngin
