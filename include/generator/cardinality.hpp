#pragma once

#include "graph/triple.hpp"
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace kgsynth {

/**
 * @brief How many edges of a relation one instance may take part in
 */
enum class CardinalityPolicy {
    UniqueObject,   // each object receives at most one edge
    UniqueSubject,  // each subject emits at most one edge
    ManyToMany      // every subject x object pair is independently eligible
};

std::string to_string(CardinalityPolicy policy);

/**
 * @brief Lookup from relation key "(Subj,pred,Obj)" to cardinality policy
 *
 * Relations not present in the table are ManyToMany.
 */
class CardinalityPolicyTable {
public:
    CardinalityPolicyTable() = default;

    void set(const Triple& relation, CardinalityPolicy policy);
    void set(const std::string& relation_key, CardinalityPolicy policy);

    CardinalityPolicy lookup(const Triple& relation) const;
    CardinalityPolicy lookup(const std::string& relation_key) const;

    size_t size() const { return policies_.size(); }
    bool empty() const { return policies_.empty(); }

    /**
     * @brief Constraints for the sample academic knowledge graph
     *
     * Companies, universities and cities have one location, colleges belong
     * to one university, departments to one college, and so on.
     */
    static CardinalityPolicyTable default_table();

    /**
     * @brief Parse {"unique_object": [...], "unique_subject": [...]}
     * @throws ConfigError on a malformed key, a non-string entry, or a
     *         relation listed under both policies
     */
    static CardinalityPolicyTable from_json(const nlohmann::ordered_json& j);

    nlohmann::ordered_json to_json() const;

private:
    // Keyed by the normalized "(s,p,o)" form
    std::map<std::string, CardinalityPolicy> policies_;
};

} // namespace kgsynth
