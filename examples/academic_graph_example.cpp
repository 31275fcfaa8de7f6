#include "generator/graph_generator.hpp"
#include "normalize/graph_normalizer.hpp"
#include <iostream>
#include <string>

using namespace kgsynth;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

int main() {
    print_separator("kgsynth Example - Academic Knowledge Graph");

    // A small catalog, built in code instead of loaded from JSON
    InstanceCatalog catalog;
    catalog.add_type("Person", {"alice", "bob", "carol"});
    catalog.add_type("City", {"nyc", "boston"});
    catalog.add_type("Company", {"acme", "globex", "initech"});

    RelationSchema schema = {
        Triple{"Person", "bornIn", "City"},
        Triple{"City", "companyLocation", "Company"},
        Triple{"Person", "worksAt", "Company"}
    };

    CardinalityPolicyTable policies;
    policies.set("(Person,bornIn,City)", CardinalityPolicy::UniqueSubject);
    policies.set("(City,companyLocation,Company)", CardinalityPolicy::UniqueObject);

    std::cout << "1. Generating with probability 0.7, seed 42:\n";
    GraphGenerator generator(0.7, 42, policies);
    generator.set_verbose(true);
    GeneratedGraph graph = generator.generate(schema, catalog);

    std::cout << "\n" << graph.to_json().dump(4) << "\n";

    print_separator("Normalizing");

    GraphNormalizer normalizer(true);
    normalizer.process(graph.to_json());
    NormalizedGraph result = normalizer.finalize();

    std::cout << "Node types:\n";
    for (const auto& label : result.node_types.labels()) {
        std::cout << "  " << label << " -> " << result.node_types.find(label)->to_hex_string() << "\n";
    }

    std::cout << "\nInstances per type:\n";
    for (const auto& [type_label, members] : result.type_instance_labels) {
        std::cout << "  " << type_label << ":";
        for (const auto& member : members) {
            std::cout << " " << member;
        }
        std::cout << "\n";
    }

    std::cout << "\n";
    normalizer.statistics().print_summary();
    return 0;
}
