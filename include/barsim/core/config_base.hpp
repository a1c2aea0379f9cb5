// include/barsim/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "barsim/core/error.hpp"

namespace barsim {

/**
 * @brief Base class for JSON-backed settings (run configuration, logger)
 *
 * Subclasses map their fields to and from a JSON object. Keys missing from
 * the document keep their current value.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write the configuration as indented JSON
     * @return FILE_IO_ERROR if the file cannot be opened
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Read a JSON object from disk and apply it
     * @return FILE_NOT_FOUND if the file cannot be opened,
     *         JSON_PARSE_ERROR on malformed JSON, a non-object document or
     *         a field of the wrong type
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @throws nlohmann::json::exception on a field of the wrong type
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace barsim
