#ifndef KGSYNTH_TRIPLE_HPP
#define KGSYNTH_TRIPLE_HPP

#include <string>
#include <vector>
#include <optional>

namespace kgsynth {

/**
 * @brief Split a "(a,b,c)" string into its comma-separated parts
 *
 * Surrounding whitespace is trimmed, one pair of enclosing parentheses is
 * removed when both are present, and every part is trimmed. No escaping is
 * supported, so the number of parts returned equals the number of commas
 * plus one. Callers decide whether the part count is acceptable.
 */
std::vector<std::string> split_triple_string(const std::string& text);

/**
 * @brief Trim ASCII whitespace from both ends
 */
std::string trim(const std::string& text);

/**
 * @brief A subject/predicate/object triple
 *
 * Used both for schema relations, where the fields hold type names, and for
 * edges, where they hold instance labels. The string form "(s,p,o)" exists
 * only at the JSON boundary.
 */
struct Triple {
    std::string subject;
    std::string predicate;
    std::string object;

    /**
     * @brief Format as "(subject,predicate,object)"
     * @throws std::invalid_argument if a field cannot be encoded
     */
    std::string to_string() const;

    /**
     * @brief Parse a triple string
     * @return The triple, or std::nullopt unless the text has exactly 3 parts
     */
    static std::optional<Triple> parse(const std::string& text);

    /**
     * @brief True if the label survives a format/parse round trip
     *
     * Labels must not contain '(', ')' or ',' and must not carry leading or
     * trailing whitespace.
     */
    static bool is_encodable_label(const std::string& label);

    bool operator==(const Triple& other) const {
        return subject == other.subject && predicate == other.predicate && object == other.object;
    }
    bool operator!=(const Triple& other) const { return !(*this == other); }
    bool operator<(const Triple& other) const;
};

} // namespace kgsynth

#endif // KGSYNTH_TRIPLE_HPP
