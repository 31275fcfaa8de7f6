#ifndef KGSYNTH_GRAPH_NORMALIZER_HPP
#define KGSYNTH_GRAPH_NORMALIZER_HPP

#include "normalize/content_id.hpp"
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace kgsynth {

// Output file names written by NormalizedGraph::write_outputs
constexpr const char* kNodeTypeMapFile = "map_node_types.json";
constexpr const char* kEdgeTypeMapFile = "map_edge_types.json";
constexpr const char* kInstanceMapFile = "map_instances.json";
constexpr const char* kTypeInstancesFile = "node_type_instances.json";
constexpr const char* kTypeInstanceLabelsFile = "node_type_instances_labels.json";

/**
 * @brief Counters collected while normalizing
 */
struct NormalizationStatistics {
    size_t relations_processed = 0;
    size_t relations_skipped = 0;
    size_t edges_processed = 0;
    size_t edges_skipped = 0;
    size_t duplicates_observed = 0;   // counted whether or not notices are printed

    void print_summary() const;
};

/**
 * @brief Finalized identifier tables and type -> instance indices
 *
 * Types appear in first-seen order. Instance lists are sorted: numerically
 * for identifiers, lexicographically for labels.
 */
struct NormalizedGraph {
    IdentifierTable node_types;
    IdentifierTable edge_types;
    IdentifierTable instances;

    std::vector<std::pair<ContentId, std::vector<ContentId>>> type_instances;
    std::vector<std::pair<std::string, std::vector<std::string>>> type_instance_labels;

    /**
     * @brief Sorted instance IDs of a node type, or nullptr if the type is unknown
     */
    const std::vector<ContentId>* instances_of(const ContentId& type_id) const;

    /**
     * @brief Sorted instance labels of a node type, or nullptr if the type is unknown
     */
    const std::vector<std::string>* instance_labels_of(const std::string& type_label) const;

    // {"<type id>": ["<instance id>", ...]} with decimal IDs
    nlohmann::ordered_json type_instances_to_json() const;

    // {"<type label>": ["<instance label>", ...]}
    nlohmann::ordered_json type_instance_labels_to_json() const;

    /**
     * @brief Write the five output tables into a directory
     * @throws OutputError
     */
    void write_outputs(const std::string& output_directory) const;
};

/**
 * @brief Re-derives typed entities and content-hash identifiers from a generated graph
 *
 * Every relation key "(SubjType,pred,ObjType)" registers two node types and
 * one edge type. Every edge "(s,pred,o)" registers the subject under the
 * subject type and the object under the object type. Instance labels share
 * one namespace across all types.
 *
 * Malformed keys and edges are skipped with a warning. An instance already
 * indexed under its type is reported in verbose mode and otherwise absorbed.
 *
 * Example:
 * @code
 *   GraphNormalizer normalizer;
 *   normalizer.process(load_graph_json("generated_kg.json"));
 *   NormalizedGraph result = normalizer.finalize();
 *   result.write_outputs("output");
 * @endcode
 */
class GraphNormalizer {
public:
    explicit GraphNormalizer(bool verbose = false) : verbose_(verbose) {}

    /**
     * @brief Process every relation of a graph document, in document order
     * @throws JsonDecodeError if the document is not a JSON object
     */
    void process(const nlohmann::ordered_json& graph);

    /**
     * @brief Process one relation key and its edge list
     */
    void add_relation(const std::string& relation_key, const nlohmann::ordered_json& edge_list);

    /**
     * @brief Sort the accumulated sets into the output tables
     */
    NormalizedGraph finalize() const;

    const NormalizationStatistics& statistics() const { return stats_; }

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    bool verbose_;

    IdentifierTable node_types_;
    IdentifierTable edge_types_;
    IdentifierTable instances_;

    std::map<ContentId, std::set<ContentId>> type_instances_;
    std::vector<ContentId> type_order_;
    std::map<std::string, std::set<std::string>> type_labels_;
    std::vector<std::string> label_order_;

    NormalizationStatistics stats_;

    void ensure_type(const ContentId& type_id, const std::string& type_label);
    void record_instance(const ContentId& type_id, const std::string& type_label,
                         const std::string& instance_label);
};

/**
 * @brief Load a generated graph document
 * @throws FileNotFoundError, JsonDecodeError (also for a non-object top level)
 */
nlohmann::ordered_json load_graph_json(const std::string& path);

} // namespace kgsynth

#endif // KGSYNTH_GRAPH_NORMALIZER_HPP
