#ifndef KGSYNTH_GRAPH_GENERATOR_HPP
#define KGSYNTH_GRAPH_GENERATOR_HPP

#include "generator/cardinality.hpp"
#include "graph/instance_catalog.hpp"
#include "graph/schema.hpp"
#include "graph/triple.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kgsynth {

/**
 * @brief Edges generated for one schema relation
 */
struct RelationEdges {
    Triple relation;                 // (SubjectType, predicate, ObjectType)
    CardinalityPolicy policy = CardinalityPolicy::ManyToMany;
    std::vector<Triple> edges;       // (subjectLabel, predicate, objectLabel), in generation order
};

/**
 * @brief A fully materialized generated knowledge graph
 *
 * Serialized as {"(Subj,pred,Obj)": ["(s,pred,o)", ...], ...} with relations
 * in schema order and edges in generation order.
 */
struct GeneratedGraph {
    std::vector<RelationEdges> relations;

    size_t num_relations() const { return relations.size(); }
    size_t num_edges() const;

    /**
     * @brief Find the entry for a relation
     * @return Pointer into relations, or nullptr if the relation was not generated
     */
    const RelationEdges* find(const Triple& relation) const;

    /**
     * @brief Convert to the on-disk JSON shape
     * @throws std::invalid_argument if a label cannot be encoded as a triple string
     */
    nlohmann::ordered_json to_json() const;

    /**
     * @brief Write to a JSON file with 4-space indentation
     *
     * Intermediate directories are created as needed.
     * @throws OutputError
     */
    void export_to_json(const std::string& filename) const;
};

/**
 * @brief Counters collected while generating
 */
struct GenerationStatistics {
    size_t relations_generated = 0;
    size_t relations_skipped = 0;     // subject or object type missing from the catalog
    size_t unique_object_edges = 0;
    size_t unique_subject_edges = 0;
    size_t many_to_many_edges = 0;

    size_t total_edges() const {
        return unique_object_edges + unique_subject_edges + many_to_many_edges;
    }

    void print_summary() const;
    nlohmann::ordered_json to_json() const;
};

/**
 * @brief Expands a relation schema into concrete edges
 *
 * For every relation, in schema order, edges are sampled under the
 * relation's cardinality policy:
 * - UniqueObject: one draw per object; on success the object is linked to a
 *   uniformly chosen subject.
 * - UniqueSubject: one draw per subject; on success the subject is linked to
 *   a uniformly chosen object.
 * - ManyToMany: one draw per (subject, object) pair, subject-major.
 *
 * A draw succeeds when a uniform value in [0, 1) is below the connection
 * probability. All draws come from a single generator stream, so a fixed
 * seed reproduces the same graph with the same standard library. The mapping
 * from std::mt19937 output to uniform_real_distribution and
 * uniform_int_distribution values is implementation-defined, so graphs built
 * with libstdc++ and libc++ from one seed may differ.
 */
class GraphGenerator {
public:
    /**
     * @param connection_probability Probability in [0, 1]
     * @param seed Seed for the random stream; std::nullopt seeds from std::random_device
     * @param policies Cardinality lookup for relation keys
     * @throws std::invalid_argument if the probability is out of range
     */
    GraphGenerator(double connection_probability,
                   std::optional<std::uint32_t> seed,
                   CardinalityPolicyTable policies = CardinalityPolicyTable());

    GeneratedGraph generate(const RelationSchema& schema, const InstanceCatalog& catalog);

    const GenerationStatistics& statistics() const { return stats_; }

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    double probability_;
    CardinalityPolicyTable policies_;
    std::mt19937 rng_;
    GenerationStatistics stats_;
    bool verbose_ = false;

    bool draw();
    size_t pick(size_t count);

    void generate_unique_object(const Triple& relation,
                                const std::vector<std::string>& subjects,
                                const std::vector<std::string>& objects,
                                std::vector<Triple>& edges);

    void generate_unique_subject(const Triple& relation,
                                 const std::vector<std::string>& subjects,
                                 const std::vector<std::string>& objects,
                                 std::vector<Triple>& edges);

    void generate_many_to_many(const Triple& relation,
                               const std::vector<std::string>& subjects,
                               const std::vector<std::string>& objects,
                               std::vector<Triple>& edges);
};

} // namespace kgsynth

#endif // KGSYNTH_GRAPH_GENERATOR_HPP
