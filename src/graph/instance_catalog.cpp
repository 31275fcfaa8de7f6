#include "graph/instance_catalog.hpp"
#include "common/errors.hpp"
#include "common/json_io.hpp"
#include "graph/triple.hpp"
#include <stdexcept>

namespace kgsynth {

InstanceCatalog InstanceCatalog::from_json(const nlohmann::ordered_json& j) {
    if (!j.is_object()) {
        throw JsonDecodeError("instance catalog must be a JSON object");
    }

    InstanceCatalog catalog;
    for (const auto& item : j.items()) {
        const std::string& type_name = item.key();
        const auto& labels = item.value();
        if (!labels.is_array()) {
            throw JsonDecodeError("instances of type '" + type_name + "' must be an array");
        }

        std::vector<std::string> instances;
        instances.reserve(labels.size());
        for (const auto& label : labels) {
            if (!label.is_string()) {
                throw JsonDecodeError("instance of type '" + type_name + "' is not a string: " +
                                      label.dump());
            }
            std::string instance = label.get<std::string>();
            if (!Triple::is_encodable_label(instance)) {
                throw JsonDecodeError("instance '" + instance + "' of type '" + type_name +
                                      "' cannot appear in a triple string");
            }
            instances.push_back(std::move(instance));
        }
        catalog.add_type(type_name, std::move(instances));
    }
    return catalog;
}

InstanceCatalog InstanceCatalog::load_from_json(const std::string& path) {
    return from_json(load_json_file(path));
}

void InstanceCatalog::add_type(const std::string& type_name, std::vector<std::string> instances) {
    types_[type_name] = std::move(instances);
}

bool InstanceCatalog::contains(const std::string& type_name) const {
    return types_.find(type_name) != types_.end();
}

const std::vector<std::string>& InstanceCatalog::instances_of(const std::string& type_name) const {
    auto it = types_.find(type_name);
    if (it == types_.end()) {
        throw std::out_of_range("Unknown node type: " + type_name);
    }
    return it->second;
}

size_t InstanceCatalog::num_instances() const {
    size_t total = 0;
    for (const auto& [type_name, instances] : types_) {
        total += instances.size();
    }
    return total;
}

} // namespace kgsynth
