// src/core/config_base.cpp

#include "barsim/core/config_base.hpp"
#include <iomanip>

namespace barsim {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Cannot open " + filepath + " for writing", "ConfigBase");
    }

    try {
        file << std::setw(4) << to_json() << std::endl;
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Writing " + filepath + " failed: " + e.what(), "ConfigBase");
    }
    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Writing " + filepath + " failed",
                                "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Config file not found: " + filepath,
                                "ConfigBase");
    }

    try {
        const nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                    "Config in " + filepath + " must be a JSON object",
                                    "ConfigBase");
        }
        from_json(j);
        return Result<void>();
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Invalid config in " + filepath + ": " + e.what(), "ConfigBase");
    }
}

}  // namespace barsim
