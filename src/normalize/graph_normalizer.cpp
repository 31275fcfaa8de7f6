#include "normalize/graph_normalizer.hpp"
#include "common/errors.hpp"
#include "common/json_io.hpp"
#include "graph/triple.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace kgsynth {

// ==========================================
// NormalizationStatistics Implementation
// ==========================================

void NormalizationStatistics::print_summary() const {
    std::cout << "Relations processed: " << relations_processed
              << " (skipped " << relations_skipped << ")\n";
    std::cout << "Edges processed:     " << edges_processed
              << " (skipped " << edges_skipped << ")\n";
    std::cout << "Duplicate instances: " << duplicates_observed << "\n";
}

// ==========================================
// NormalizedGraph Implementation
// ==========================================

const std::vector<ContentId>* NormalizedGraph::instances_of(const ContentId& type_id) const {
    for (const auto& [id, members] : type_instances) {
        if (id == type_id) return &members;
    }
    return nullptr;
}

const std::vector<std::string>* NormalizedGraph::instance_labels_of(const std::string& type_label) const {
    for (const auto& [label, members] : type_instance_labels) {
        if (label == type_label) return &members;
    }
    return nullptr;
}

nlohmann::ordered_json NormalizedGraph::type_instances_to_json() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& [type_id, members] : type_instances) {
        nlohmann::ordered_json ids = nlohmann::ordered_json::array();
        for (const auto& id : members) {
            ids.push_back(id.to_decimal_string());
        }
        j[type_id.to_decimal_string()] = std::move(ids);
    }
    return j;
}

nlohmann::ordered_json NormalizedGraph::type_instance_labels_to_json() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& [type_label, members] : type_instance_labels) {
        j[type_label] = members;
    }
    return j;
}

void NormalizedGraph::write_outputs(const std::string& output_directory) const {
    ensure_directory(output_directory);

    const std::vector<std::pair<const char*, nlohmann::ordered_json>> outputs = {
        {kNodeTypeMapFile, node_types.to_json()},
        {kEdgeTypeMapFile, edge_types.to_json()},
        {kInstanceMapFile, instances.to_json()},
        {kTypeInstancesFile, type_instances_to_json()},
        {kTypeInstanceLabelsFile, type_instance_labels_to_json()}
    };

    std::cout << "Writing output files...\n";
    for (const auto& [name, document] : outputs) {
        std::string path = (fs::path(output_directory) / name).string();
        save_json_file(path, document);
        std::cout << "Created " << path << "\n";
    }
}

// ==========================================
// GraphNormalizer Implementation
// ==========================================

void GraphNormalizer::process(const nlohmann::ordered_json& graph) {
    if (!graph.is_object()) {
        throw JsonDecodeError("graph must be a JSON object of relation keys to edge lists");
    }

    for (const auto& item : graph.items()) {
        add_relation(item.key(), item.value());
    }
}

void GraphNormalizer::add_relation(const std::string& relation_key, const nlohmann::ordered_json& edge_list) {
    auto relation = Triple::parse(relation_key);
    if (!relation) {
        std::cerr << "Warning: Skipping malformed key '" << relation_key << "'\n";
        stats_.relations_skipped++;
        return;
    }
    if (!edge_list.is_array()) {
        std::cerr << "Warning: Skipping key '" << relation_key << "' whose edges are not a list\n";
        stats_.relations_skipped++;
        return;
    }

    ContentId subj_type_id = node_types_.get_or_assign(relation->subject);
    ContentId obj_type_id = node_types_.get_or_assign(relation->object);
    edge_types_.get_or_assign(relation->predicate);

    ensure_type(subj_type_id, relation->subject);
    ensure_type(obj_type_id, relation->object);
    stats_.relations_processed++;

    for (const auto& value : edge_list) {
        std::optional<Triple> edge;
        if (value.is_string()) {
            edge = Triple::parse(value.get<std::string>());
        }
        if (!edge) {
            std::string shown = value.is_string() ? value.get<std::string>() : value.dump();
            std::cerr << "Warning: Skipping malformed instance string '" << shown
                      << "' in key '" << relation_key << "'\n";
            stats_.edges_skipped++;
            continue;
        }

        // The edge's own predicate is not indexed
        record_instance(subj_type_id, relation->subject, edge->subject);
        record_instance(obj_type_id, relation->object, edge->object);
        stats_.edges_processed++;
    }
}

void GraphNormalizer::ensure_type(const ContentId& type_id, const std::string& type_label) {
    if (type_instances_.find(type_id) == type_instances_.end()) {
        type_instances_[type_id];
        type_order_.push_back(type_id);
    }
    if (type_labels_.find(type_label) == type_labels_.end()) {
        type_labels_[type_label];
        label_order_.push_back(type_label);
    }
}

void GraphNormalizer::record_instance(const ContentId& type_id, const std::string& type_label,
                                      const std::string& instance_label) {
    ContentId instance_id = instances_.get_or_assign(instance_label);

    auto& members = type_instances_[type_id];
    if (members.count(instance_id) > 0) {
        stats_.duplicates_observed++;
        if (verbose_) {
            std::cout << "Duplicate instance detected: '" << instance_label
                      << "' for node type '" << type_label << "'\n";
        }
    }
    members.insert(instance_id);
    type_labels_[type_label].insert(instance_label);
}

NormalizedGraph GraphNormalizer::finalize() const {
    NormalizedGraph result;
    result.node_types = node_types_;
    result.edge_types = edge_types_;
    result.instances = instances_;

    // std::set iteration is already ascending
    for (const auto& type_id : type_order_) {
        const auto& members = type_instances_.at(type_id);
        result.type_instances.emplace_back(type_id, std::vector<ContentId>(members.begin(), members.end()));
    }
    for (const auto& type_label : label_order_) {
        const auto& members = type_labels_.at(type_label);
        result.type_instance_labels.emplace_back(type_label,
                                                 std::vector<std::string>(members.begin(), members.end()));
    }
    return result;
}

nlohmann::ordered_json load_graph_json(const std::string& path) {
    nlohmann::ordered_json j = load_json_file(path);
    if (!j.is_object()) {
        throw JsonDecodeError("graph file " + path + " must hold a JSON object");
    }
    return j;
}

} // namespace kgsynth
