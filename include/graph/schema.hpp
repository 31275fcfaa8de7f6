#ifndef KGSYNTH_SCHEMA_HPP
#define KGSYNTH_SCHEMA_HPP

#include "graph/triple.hpp"
#include <istream>
#include <string>
#include <vector>

namespace kgsynth {

/**
 * @brief Ordered list of (SubjectType, predicate, ObjectType) relations
 *
 * File order is preserved; it fixes the order in which relations consume
 * random draws during generation.
 */
using RelationSchema = std::vector<Triple>;

/**
 * @brief Parse schema text, one "(SubjectType,predicate,ObjectType)" per line
 * @param input Text source
 * @param verbose Report skipped malformed lines on stderr
 *
 * Blank lines are ignored. Lines that are not parenthesized or do not hold
 * exactly three parts are skipped.
 */
RelationSchema parse_schema(std::istream& input, bool verbose = false);

/**
 * @brief Read a schema file
 * @return The relations, or an empty schema if the file cannot be read
 *
 * Read failures are reported on stderr. Callers treat an empty schema as a
 * hard stop.
 */
RelationSchema load_schema(const std::string& path, bool verbose = false);

} // namespace kgsynth

#endif // KGSYNTH_SCHEMA_HPP
