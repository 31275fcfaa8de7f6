#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kgsynth {

/**
 * @brief 128-bit identifier derived from a label's content
 *
 * The value is the big-endian unsigned interpretation of the MD5 digest of
 * the label's UTF-8 bytes. Equal labels always yield equal identifiers;
 * collisions between distinct labels are not handled.
 */
struct ContentId {
    std::uint64_t high = 0;
    std::uint64_t low = 0;

    /**
     * @brief Hash a label
     * @throws std::runtime_error if the digest cannot be computed
     */
    static ContentId from_label(const std::string& label);

    /**
     * @brief Parse a decimal string produced by to_decimal_string()
     * @throws std::invalid_argument on non-digits or overflow
     */
    static ContentId from_decimal_string(const std::string& text);

    std::string to_decimal_string() const;
    std::string to_hex_string() const;

    bool operator==(const ContentId& other) const { return high == other.high && low == other.low; }
    bool operator!=(const ContentId& other) const { return !(*this == other); }
    bool operator<(const ContentId& other) const {
        return high != other.high ? high < other.high : low < other.low;
    }
};

/**
 * @brief Label -> ContentId table for one namespace
 *
 * Node types, edge types and instances each get their own table. Labels are
 * reported in first-seen order.
 */
class IdentifierTable {
public:
    /**
     * @brief Return the label's identifier, hashing and storing it on first sight
     */
    ContentId get_or_assign(const std::string& label);

    bool contains(const std::string& label) const;
    const ContentId* find(const std::string& label) const;

    size_t size() const { return ids_.size(); }
    bool empty() const { return ids_.empty(); }

    const std::vector<std::string>& labels() const { return order_; }

    // {"label": "<decimal id>", ...} in first-seen order
    nlohmann::ordered_json to_json() const;

private:
    std::map<std::string, ContentId> ids_;
    std::vector<std::string> order_;
};

} // namespace kgsynth
