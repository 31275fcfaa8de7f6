#include "generator/generator_config.hpp"
#include "common/errors.hpp"
#include "common/json_io.hpp"
#include <limits>

namespace kgsynth {

GeneratorConfig GeneratorConfig::from_json_file(const std::string& path) {
    GeneratorConfig config;
    config.merge_json(load_json_file(path));
    return config;
}

void GeneratorConfig::merge_json(const nlohmann::ordered_json& j) {
    if (!j.is_object()) {
        throw ConfigError("generator config must be a JSON object");
    }

    try {
        if (j.contains("schema_path")) schema_path = j["schema_path"].get<std::string>();
        if (j.contains("instances_path")) instances_path = j["instances_path"].get<std::string>();
        if (j.contains("output_path")) output_path = j["output_path"].get<std::string>();
        if (j.contains("connection_probability")) {
            connection_probability = j["connection_probability"].get<double>();
        }
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigError(e.what());
    }

    if (j.contains("seed")) {
        const auto& s = j["seed"];
        if (s.is_null()) {
            seed.reset();
        } else if (s.is_number_unsigned() &&
                   s.get<std::uint64_t>() <= std::numeric_limits<std::uint32_t>::max()) {
            seed = static_cast<std::uint32_t>(s.get<std::uint64_t>());
        } else {
            throw ConfigError("seed must be null or an unsigned 32-bit integer");
        }
    }

    if (j.contains("cardinality")) {
        cardinality = CardinalityPolicyTable::from_json(j["cardinality"]);
    }
}

nlohmann::ordered_json GeneratorConfig::to_json() const {
    nlohmann::ordered_json j;
    j["schema_path"] = schema_path;
    j["instances_path"] = instances_path;
    j["output_path"] = output_path;
    j["connection_probability"] = connection_probability;
    if (seed) {
        j["seed"] = *seed;
    } else {
        j["seed"] = nullptr;
    }
    j["cardinality"] = cardinality.to_json();
    j["verbose"] = verbose;
    return j;
}

bool GeneratorConfig::validate(std::string& error_message) const {
    if (schema_path.empty()) {
        error_message = "Schema path is required";
        return false;
    }

    if (instances_path.empty()) {
        error_message = "Instances path is required";
        return false;
    }

    if (output_path.empty()) {
        error_message = "Output path is required";
        return false;
    }

    // Negated form also rejects NaN
    if (!(connection_probability >= 0.0 && connection_probability <= 1.0)) {
        error_message = "Connection probability must be between 0.0 and 1.0";
        return false;
    }

    return true;
}

} // namespace kgsynth
