#include "normalize/content_id.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <array>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace kgsynth {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

// 128-bit value as four 32-bit limbs, most significant first
using Limbs = std::array<std::uint32_t, 4>;

Limbs to_limbs(const ContentId& id) {
    return {static_cast<std::uint32_t>(id.high >> 32), static_cast<std::uint32_t>(id.high),
            static_cast<std::uint32_t>(id.low >> 32), static_cast<std::uint32_t>(id.low)};
}

// Divides in place, returns the remainder
std::uint32_t divide(Limbs& limbs, std::uint32_t divisor) {
    std::uint64_t remainder = 0;
    for (auto& limb : limbs) {
        std::uint64_t current = (remainder << 32) | limb;
        limb = static_cast<std::uint32_t>(current / divisor);
        remainder = current % divisor;
    }
    return static_cast<std::uint32_t>(remainder);
}

bool is_zero(const Limbs& limbs) {
    return std::all_of(limbs.begin(), limbs.end(), [](std::uint32_t l) { return l == 0; });
}

} // namespace

// ==========================================
// ContentId Implementation
// ==========================================

ContentId ContentId::from_label(const std::string& label) {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to allocate digest context");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (1 != EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) ||
        1 != EVP_DigestUpdate(ctx.get(), label.data(), label.size()) ||
        1 != EVP_DigestFinal_ex(ctx.get(), digest, &digest_len)) {
        throw std::runtime_error("MD5 digest failed for label '" + label + "'");
    }
    if (digest_len != 16) {
        throw std::runtime_error("Unexpected MD5 digest length");
    }

    ContentId id;
    for (int i = 0; i < 8; ++i) {
        id.high = (id.high << 8) | digest[i];
        id.low = (id.low << 8) | digest[i + 8];
    }
    return id;
}

ContentId ContentId::from_decimal_string(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Empty identifier");
    }

    ContentId id;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Identifier is not a decimal number: " + text);
        }
        // id = id * 10 + digit, detecting overflow out of the top limb
        Limbs limbs = to_limbs(id);
        std::uint64_t carry = static_cast<std::uint64_t>(c - '0');
        for (auto it = limbs.rbegin(); it != limbs.rend(); ++it) {
            std::uint64_t current = static_cast<std::uint64_t>(*it) * 10 + carry;
            *it = static_cast<std::uint32_t>(current);
            carry = current >> 32;
        }
        if (carry != 0) {
            throw std::invalid_argument("Identifier exceeds 128 bits: " + text);
        }
        id.high = (static_cast<std::uint64_t>(limbs[0]) << 32) | limbs[1];
        id.low = (static_cast<std::uint64_t>(limbs[2]) << 32) | limbs[3];
    }
    return id;
}

std::string ContentId::to_decimal_string() const {
    Limbs limbs = to_limbs(*this);
    if (is_zero(limbs)) return "0";

    std::string digits;
    while (!is_zero(limbs)) {
        digits.push_back(static_cast<char>('0' + divide(limbs, 10)));
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string ContentId::to_hex_string() const {
    std::stringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(16) << high << std::setw(16) << low;
    return ss.str();
}

// ==========================================
// IdentifierTable Implementation
// ==========================================

ContentId IdentifierTable::get_or_assign(const std::string& label) {
    auto it = ids_.find(label);
    if (it != ids_.end()) {
        return it->second;
    }

    ContentId id = ContentId::from_label(label);
    ids_.emplace(label, id);
    order_.push_back(label);
    return id;
}

bool IdentifierTable::contains(const std::string& label) const {
    return ids_.find(label) != ids_.end();
}

const ContentId* IdentifierTable::find(const std::string& label) const {
    auto it = ids_.find(label);
    return it == ids_.end() ? nullptr : &it->second;
}

nlohmann::ordered_json IdentifierTable::to_json() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& label : order_) {
        j[label] = ids_.at(label).to_decimal_string();
    }
    return j;
}

} // namespace kgsynth
