#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace kgsynth {

// Indentation used for every JSON document this tool writes
constexpr int kJsonIndent = 4;

/**
 * @brief Read and parse a whole JSON document
 * @throws FileNotFoundError if the path does not exist
 * @throws JsonDecodeError if the file cannot be read or parsed
 *
 * Object keys keep their on-disk order.
 */
nlohmann::ordered_json load_json_file(const std::string& path);

/**
 * @brief Serialize a document to a file, creating parent directories
 * @throws OutputError if the directories or the file cannot be created
 */
void save_json_file(const std::string& path, const nlohmann::ordered_json& j);

/**
 * @brief Create a directory and its parents if missing
 * @throws OutputError on failure
 */
void ensure_directory(const std::string& path);

} // namespace kgsynth
