#include "common/json_io.hpp"
#include "common/errors.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace kgsynth {

nlohmann::ordered_json load_json_file(const std::string& path) {
    if (!fs::exists(path)) {
        throw FileNotFoundError(path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw JsonDecodeError("Failed to open file for reading: " + path);
    }

    nlohmann::ordered_json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw JsonDecodeError(e.what());
    }
    return j;
}

void ensure_directory(const std::string& path) {
    if (path.empty()) return;

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        throw OutputError("Failed to create directory " + path + ": " + ec.message());
    }
}

void save_json_file(const std::string& path, const nlohmann::ordered_json& j) {
    ensure_directory(fs::path(path).parent_path().string());

    std::ofstream file(path);
    if (!file.is_open()) {
        throw OutputError("Failed to open file for writing: " + path);
    }

    file << j.dump(kJsonIndent);
    file.close();
    if (file.fail()) {
        throw OutputError("Failed to write file: " + path);
    }
}

} // namespace kgsynth
