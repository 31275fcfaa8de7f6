#include "generator/cardinality.hpp"
#include "common/errors.hpp"

namespace kgsynth {

namespace {

// Canonical "(s,p,o)" form so that "( A , p , B )" and "(A,p,B)" coincide
std::string canonical_key(const std::string& relation_key) {
    auto relation = Triple::parse(relation_key);
    if (!relation) {
        throw ConfigError("malformed relation key in cardinality table: '" + relation_key + "'");
    }
    return relation->to_string();
}

void read_policy_list(const nlohmann::ordered_json& j, const std::string& field,
                      CardinalityPolicy policy, CardinalityPolicyTable& table,
                      std::map<std::string, CardinalityPolicy>& seen) {
    if (!j.contains(field)) return;

    const auto& keys = j.at(field);
    if (!keys.is_array()) {
        throw ConfigError("'" + field + "' must be an array of relation keys");
    }

    for (const auto& key : keys) {
        if (!key.is_string()) {
            throw ConfigError("'" + field + "' contains a non-string entry: " + key.dump());
        }
        std::string canonical = canonical_key(key.get<std::string>());
        auto it = seen.find(canonical);
        if (it != seen.end() && it->second != policy) {
            throw ConfigError("relation " + canonical + " is listed as both " +
                              to_string(it->second) + " and " + to_string(policy));
        }
        seen[canonical] = policy;
        table.set(canonical, policy);
    }
}

} // namespace

std::string to_string(CardinalityPolicy policy) {
    switch (policy) {
        case CardinalityPolicy::UniqueObject:  return "unique_object";
        case CardinalityPolicy::UniqueSubject: return "unique_subject";
        case CardinalityPolicy::ManyToMany:    return "many_to_many";
    }
    return "unknown";
}

void CardinalityPolicyTable::set(const Triple& relation, CardinalityPolicy policy) {
    policies_[relation.to_string()] = policy;
}

void CardinalityPolicyTable::set(const std::string& relation_key, CardinalityPolicy policy) {
    policies_[canonical_key(relation_key)] = policy;
}

CardinalityPolicy CardinalityPolicyTable::lookup(const Triple& relation) const {
    auto it = policies_.find(relation.to_string());
    return it == policies_.end() ? CardinalityPolicy::ManyToMany : it->second;
}

CardinalityPolicy CardinalityPolicyTable::lookup(const std::string& relation_key) const {
    auto relation = Triple::parse(relation_key);
    if (!relation) return CardinalityPolicy::ManyToMany;
    return lookup(*relation);
}

CardinalityPolicyTable CardinalityPolicyTable::default_table() {
    CardinalityPolicyTable table;
    table.set(Triple{"City", "companyLocation", "Company"}, CardinalityPolicy::UniqueObject);
    table.set(Triple{"City", "universityLocation", "University"}, CardinalityPolicy::UniqueObject);
    table.set(Triple{"State", "stateOf", "City"}, CardinalityPolicy::UniqueObject);
    table.set(Triple{"University", "hasCollege", "College"}, CardinalityPolicy::UniqueObject);
    table.set(Triple{"College", "hasDepartment", "Department"}, CardinalityPolicy::UniqueObject);
    table.set(Triple{"Department", "offersCourse", "Course"}, CardinalityPolicy::UniqueObject);
    table.set(Triple{"Degree", "degreeMajor", "Major"}, CardinalityPolicy::UniqueObject);
    table.set(Triple{"Degree", "degreeLevel", "DegreeLevel"}, CardinalityPolicy::UniqueObject);
    table.set(Triple{"Course", "courseSubject", "Subject"}, CardinalityPolicy::UniqueObject);
    return table;
}

CardinalityPolicyTable CardinalityPolicyTable::from_json(const nlohmann::ordered_json& j) {
    if (!j.is_object()) {
        throw ConfigError("cardinality must be a JSON object");
    }

    CardinalityPolicyTable table;
    std::map<std::string, CardinalityPolicy> seen;
    read_policy_list(j, "unique_object", CardinalityPolicy::UniqueObject, table, seen);
    read_policy_list(j, "unique_subject", CardinalityPolicy::UniqueSubject, table, seen);
    return table;
}

nlohmann::ordered_json CardinalityPolicyTable::to_json() const {
    nlohmann::ordered_json j;
    j["unique_object"] = nlohmann::ordered_json::array();
    j["unique_subject"] = nlohmann::ordered_json::array();
    for (const auto& [key, policy] : policies_) {
        if (policy == CardinalityPolicy::UniqueObject) {
            j["unique_object"].push_back(key);
        } else if (policy == CardinalityPolicy::UniqueSubject) {
            j["unique_subject"].push_back(key);
        }
    }
    return j;
}

} // namespace kgsynth
