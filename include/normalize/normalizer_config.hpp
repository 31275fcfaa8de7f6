#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace kgsynth {

/**
 * @brief Settings for one normalization run
 */
struct NormalizerConfig {
    std::string input_path;                   ///< Generated graph JSON
    std::string output_directory = "output";  ///< Receives the five output tables
    bool verbose = false;                     ///< Report duplicate instances

    /**
     * @brief Load configuration from JSON file
     * @throws FileNotFoundError, JsonDecodeError, ConfigError
     */
    static NormalizerConfig from_json_file(const std::string& path);

    void merge_json(const nlohmann::ordered_json& j);
    nlohmann::ordered_json to_json() const;

    bool validate(std::string& error_message) const;
};

} // namespace kgsynth
