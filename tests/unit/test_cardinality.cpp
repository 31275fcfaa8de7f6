#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "generator/cardinality.hpp"

using namespace kgsynth;

TEST(CardinalityPolicyTableTest, AbsentRelationIsManyToMany) {
    CardinalityPolicyTable table;
    EXPECT_EQ(table.lookup(Triple{"Person", "bornIn", "City"}), CardinalityPolicy::ManyToMany);
    EXPECT_EQ(table.lookup("(Person,bornIn,City)"), CardinalityPolicy::ManyToMany);
}

TEST(CardinalityPolicyTableTest, SetAndLookup) {
    CardinalityPolicyTable table;
    table.set(Triple{"Person", "bornIn", "City"}, CardinalityPolicy::UniqueSubject);
    table.set("(City,companyLocation,Company)", CardinalityPolicy::UniqueObject);

    EXPECT_EQ(table.size(), 2);
    EXPECT_EQ(table.lookup(Triple{"Person", "bornIn", "City"}), CardinalityPolicy::UniqueSubject);
    EXPECT_EQ(table.lookup(Triple{"City", "companyLocation", "Company"}), CardinalityPolicy::UniqueObject);
}

TEST(CardinalityPolicyTableTest, LookupMatchesWholeKey) {
    CardinalityPolicyTable table;
    table.set("(City,companyLocation,Company)", CardinalityPolicy::UniqueObject);

    // Same predicate, different types
    EXPECT_EQ(table.lookup(Triple{"Town", "companyLocation", "Company"}), CardinalityPolicy::ManyToMany);
    // Whitespace inside the key is not significant
    EXPECT_EQ(table.lookup("( City , companyLocation , Company )"), CardinalityPolicy::UniqueObject);
}

TEST(CardinalityPolicyTableTest, DefaultTableHoldsUniqueObjectRelations) {
    auto table = CardinalityPolicyTable::default_table();
    EXPECT_EQ(table.size(), 9);
    EXPECT_EQ(table.lookup("(City,companyLocation,Company)"), CardinalityPolicy::UniqueObject);
    EXPECT_EQ(table.lookup("(Course,courseSubject,Subject)"), CardinalityPolicy::UniqueObject);
    EXPECT_EQ(table.lookup("(Person,bornIn,City)"), CardinalityPolicy::ManyToMany);
}

TEST(CardinalityPolicyTableTest, FromJson) {
    auto j = nlohmann::ordered_json::parse(R"json({
        "unique_object": ["(State,stateOf,City)"],
        "unique_subject": ["(Person,bornIn,City)"]
    })json");
    auto table = CardinalityPolicyTable::from_json(j);

    EXPECT_EQ(table.lookup("(State,stateOf,City)"), CardinalityPolicy::UniqueObject);
    EXPECT_EQ(table.lookup("(Person,bornIn,City)"), CardinalityPolicy::UniqueSubject);
}

TEST(CardinalityPolicyTableTest, FromJsonRejectsConflicts) {
    auto j = nlohmann::ordered_json::parse(R"json({
        "unique_object": ["(Person,bornIn,City)"],
        "unique_subject": ["(Person, bornIn, City)"]
    })json");
    EXPECT_THROW(CardinalityPolicyTable::from_json(j), ConfigError);
}

TEST(CardinalityPolicyTableTest, FromJsonRejectsMalformedKeys) {
    EXPECT_THROW(CardinalityPolicyTable::from_json(nlohmann::ordered_json::parse(R"json({"unique_object": ["(a,b)"]})json")),
                 ConfigError);
    EXPECT_THROW(CardinalityPolicyTable::from_json(nlohmann::ordered_json::parse(R"json({"unique_object": [1]})json")),
                 ConfigError);
    EXPECT_THROW(CardinalityPolicyTable::from_json(nlohmann::ordered_json::parse(R"json({"unique_object": "x"})json")),
                 ConfigError);
}

TEST(CardinalityPolicyTableTest, JsonRoundTrip) {
    auto table = CardinalityPolicyTable::default_table();
    table.set("(Person,bornIn,City)", CardinalityPolicy::UniqueSubject);

    auto restored = CardinalityPolicyTable::from_json(table.to_json());
    EXPECT_EQ(restored.size(), table.size());
    EXPECT_EQ(restored.lookup("(Person,bornIn,City)"), CardinalityPolicy::UniqueSubject);
    EXPECT_EQ(restored.lookup("(State,stateOf,City)"), CardinalityPolicy::UniqueObject);
}

TEST(CardinalityPolicyTest, ToString) {
    EXPECT_EQ(to_string(CardinalityPolicy::UniqueObject), "unique_object");
    EXPECT_EQ(to_string(CardinalityPolicy::UniqueSubject), "unique_subject");
    EXPECT_EQ(to_string(CardinalityPolicy::ManyToMany), "many_to_many");
}
