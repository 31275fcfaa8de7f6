#include "graph/schema.hpp"
#include <fstream>
#include <iostream>

namespace kgsynth {

namespace {

bool has_encodable_labels(const Triple& relation) {
    return Triple::is_encodable_label(relation.subject) &&
           Triple::is_encodable_label(relation.predicate) &&
           Triple::is_encodable_label(relation.object);
}

} // namespace

RelationSchema parse_schema(std::istream& input, bool verbose) {
    RelationSchema relations;
    std::string line;
    size_t line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        std::string stripped = trim(line);
        if (stripped.empty()) continue;

        bool parenthesized = stripped.size() >= 2 &&
                             stripped.front() == '(' && stripped.back() == ')';
        auto relation = parenthesized ? Triple::parse(stripped) : std::nullopt;
        if (!relation || !has_encodable_labels(*relation)) {
            if (verbose) {
                std::cerr << "Warning: Skipping malformed schema line " << line_number
                          << ": '" << stripped << "'\n";
            }
            continue;
        }
        relations.push_back(*relation);
    }

    return relations;
}

RelationSchema load_schema(const std::string& path, bool verbose) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error reading schema: cannot open " << path << "\n";
        return {};
    }

    RelationSchema relations = parse_schema(file, verbose);
    if (file.bad()) {
        std::cerr << "Error reading schema: I/O failure on " << path << "\n";
        return {};
    }
    return relations;
}

} // namespace kgsynth
