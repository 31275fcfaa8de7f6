#include "generator/graph_generator.hpp"
#include "common/json_io.hpp"
#include <iostream>
#include <stdexcept>

namespace kgsynth {

// ==========================================
// GeneratedGraph Implementation
// ==========================================

size_t GeneratedGraph::num_edges() const {
    size_t total = 0;
    for (const auto& entry : relations) {
        total += entry.edges.size();
    }
    return total;
}

const RelationEdges* GeneratedGraph::find(const Triple& relation) const {
    for (const auto& entry : relations) {
        if (entry.relation == relation) return &entry;
    }
    return nullptr;
}

nlohmann::ordered_json GeneratedGraph::to_json() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& entry : relations) {
        nlohmann::ordered_json edge_list = nlohmann::ordered_json::array();
        for (const auto& edge : entry.edges) {
            edge_list.push_back(edge.to_string());
        }
        j[entry.relation.to_string()] = std::move(edge_list);
    }
    return j;
}

void GeneratedGraph::export_to_json(const std::string& filename) const {
    save_json_file(filename, to_json());
}

// ==========================================
// GenerationStatistics Implementation
// ==========================================

void GenerationStatistics::print_summary() const {
    std::cout << "Relations generated: " << relations_generated << "\n";
    std::cout << "Relations skipped:   " << relations_skipped << "\n";
    std::cout << "Edges: " << total_edges()
              << " (unique_object " << unique_object_edges
              << ", unique_subject " << unique_subject_edges
              << ", many_to_many " << many_to_many_edges << ")\n";
}

nlohmann::ordered_json GenerationStatistics::to_json() const {
    nlohmann::ordered_json j;
    j["relations_generated"] = relations_generated;
    j["relations_skipped"] = relations_skipped;
    j["unique_object_edges"] = unique_object_edges;
    j["unique_subject_edges"] = unique_subject_edges;
    j["many_to_many_edges"] = many_to_many_edges;
    j["total_edges"] = total_edges();
    return j;
}

// ==========================================
// GraphGenerator Implementation
// ==========================================

GraphGenerator::GraphGenerator(double connection_probability,
                               std::optional<std::uint32_t> seed,
                               CardinalityPolicyTable policies)
    : probability_(connection_probability),
      policies_(std::move(policies)) {
    if (!(connection_probability >= 0.0 && connection_probability <= 1.0)) {
        throw std::invalid_argument("Connection probability must be in [0, 1]");
    }

    if (seed) {
        rng_.seed(*seed);
    } else {
        std::random_device rd;
        rng_.seed(rd());
    }
}

bool GraphGenerator::draw() {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    double u = unit(rng_);
    // generate_canonical may round up to 1.0; p = 1 must still connect everything
    return probability_ >= 1.0 || u < probability_;
}

size_t GraphGenerator::pick(size_t count) {
    std::uniform_int_distribution<size_t> index(0, count - 1);
    return index(rng_);
}

GeneratedGraph GraphGenerator::generate(const RelationSchema& schema, const InstanceCatalog& catalog) {
    GeneratedGraph graph;
    stats_ = GenerationStatistics();

    for (const auto& relation : schema) {
        std::string key = relation.to_string();

        if (!catalog.contains(relation.subject)) {
            std::cerr << "Warning: Subject Type '" << relation.subject << "' for relation '"
                      << key << "' not found in instances.\n";
            stats_.relations_skipped++;
            continue;
        }
        if (!catalog.contains(relation.object)) {
            std::cerr << "Warning: Object Type '" << relation.object << "' for relation '"
                      << key << "' not found in instances.\n";
            stats_.relations_skipped++;
            continue;
        }

        const auto& subjects = catalog.instances_of(relation.subject);
        const auto& objects = catalog.instances_of(relation.object);

        RelationEdges entry;
        entry.relation = relation;
        entry.policy = policies_.lookup(relation);

        switch (entry.policy) {
            case CardinalityPolicy::UniqueObject:
                generate_unique_object(relation, subjects, objects, entry.edges);
                stats_.unique_object_edges += entry.edges.size();
                break;
            case CardinalityPolicy::UniqueSubject:
                generate_unique_subject(relation, subjects, objects, entry.edges);
                stats_.unique_subject_edges += entry.edges.size();
                break;
            case CardinalityPolicy::ManyToMany:
                generate_many_to_many(relation, subjects, objects, entry.edges);
                stats_.many_to_many_edges += entry.edges.size();
                break;
        }

        if (verbose_) {
            std::cout << "  " << key << " [" << to_string(entry.policy) << "]: "
                      << entry.edges.size() << " edges\n";
        }

        stats_.relations_generated++;
        graph.relations.push_back(std::move(entry));
    }

    return graph;
}

void GraphGenerator::generate_unique_object(const Triple& relation,
                                            const std::vector<std::string>& subjects,
                                            const std::vector<std::string>& objects,
                                            std::vector<Triple>& edges) {
    for (const auto& o : objects) {
        // The draw is consumed even when no subject exists
        if (draw() && !subjects.empty()) {
            const auto& s = subjects[pick(subjects.size())];
            edges.push_back(Triple{s, relation.predicate, o});
        }
    }
}

void GraphGenerator::generate_unique_subject(const Triple& relation,
                                             const std::vector<std::string>& subjects,
                                             const std::vector<std::string>& objects,
                                             std::vector<Triple>& edges) {
    for (const auto& s : subjects) {
        if (draw() && !objects.empty()) {
            const auto& o = objects[pick(objects.size())];
            edges.push_back(Triple{s, relation.predicate, o});
        }
    }
}

void GraphGenerator::generate_many_to_many(const Triple& relation,
                                           const std::vector<std::string>& subjects,
                                           const std::vector<std::string>& objects,
                                           std::vector<Triple>& edges) {
    for (const auto& s : subjects) {
        for (const auto& o : objects) {
            if (draw()) {
                edges.push_back(Triple{s, relation.predicate, o});
            }
        }
    }
}

} // namespace kgsynth
