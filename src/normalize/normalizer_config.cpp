#include "normalize/normalizer_config.hpp"
#include "common/errors.hpp"
#include "common/json_io.hpp"

namespace kgsynth {

NormalizerConfig NormalizerConfig::from_json_file(const std::string& path) {
    NormalizerConfig config;
    config.merge_json(load_json_file(path));
    return config;
}

void NormalizerConfig::merge_json(const nlohmann::ordered_json& j) {
    if (!j.is_object()) {
        throw ConfigError("normalizer config must be a JSON object");
    }

    try {
        if (j.contains("input_path")) input_path = j["input_path"].get<std::string>();
        if (j.contains("output_directory")) output_directory = j["output_directory"].get<std::string>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigError(e.what());
    }
}

nlohmann::ordered_json NormalizerConfig::to_json() const {
    nlohmann::ordered_json j;
    j["input_path"] = input_path;
    j["output_directory"] = output_directory;
    j["verbose"] = verbose;
    return j;
}

bool NormalizerConfig::validate(std::string& error_message) const {
    if (input_path.empty()) {
        error_message = "Input file is required";
        return false;
    }

    if (output_directory.empty()) {
        error_message = "Output directory is required";
        return false;
    }

    return true;
}

} // namespace kgsynth
