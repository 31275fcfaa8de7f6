#pragma once

#include "generator/cardinality.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace kgsynth {

/**
 * @brief Settings for one graph generation run
 */
struct GeneratorConfig {
    // Inputs and output
    std::string schema_path = "input/schema.txt";         ///< Relation schema, one triple per line
    std::string instances_path = "input/instances.json";  ///< Instance catalog JSON
    std::string output_path = "generated_kg.json";        ///< Generated graph JSON

    // Sampling
    double connection_probability = 0.5;        ///< Probability [0, 1] that an eligible edge is emitted
    std::optional<std::uint32_t> seed = 42;     ///< Unset means non-reproducible draws

    CardinalityPolicyTable cardinality = CardinalityPolicyTable::default_table();

    bool verbose = false;                       ///< Report skipped schema lines and per-relation counts

    /**
     * @brief Load configuration from JSON file
     *
     * Missing fields keep their defaults. "seed": null disables seeding.
     * @throws FileNotFoundError, JsonDecodeError, ConfigError
     */
    static GeneratorConfig from_json_file(const std::string& path);

    /**
     * @brief Apply the fields present in a JSON object on top of this config
     * @throws ConfigError on a field of the wrong type
     */
    void merge_json(const nlohmann::ordered_json& j);

    nlohmann::ordered_json to_json() const;

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

} // namespace kgsynth
