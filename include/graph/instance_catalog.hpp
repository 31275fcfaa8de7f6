#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kgsynth {

/**
 * @brief Per-type enumeration of instance labels available for generation
 *
 * Built from a JSON object {"<TypeName>": ["<label>", ...], ...}. Label order
 * within a type is kept as read. Labels are assumed unique per type; this is
 * not enforced.
 */
class InstanceCatalog {
public:
    InstanceCatalog() = default;

    /**
     * @brief Build from a parsed JSON document
     * @throws JsonDecodeError if the document does not have the expected shape
     */
    static InstanceCatalog from_json(const nlohmann::ordered_json& j);

    /**
     * @brief Load from a JSON file
     * @throws FileNotFoundError, JsonDecodeError
     */
    static InstanceCatalog load_from_json(const std::string& path);

    void add_type(const std::string& type_name, std::vector<std::string> instances);

    bool contains(const std::string& type_name) const;

    /**
     * @brief Instances of a type, in catalog order
     * @throws std::out_of_range if the type is unknown
     */
    const std::vector<std::string>& instances_of(const std::string& type_name) const;

    size_t num_types() const { return types_.size(); }
    size_t num_instances() const;

private:
    std::map<std::string, std::vector<std::string>> types_;
};

} // namespace kgsynth
