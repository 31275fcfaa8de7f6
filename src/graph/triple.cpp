#include "graph/triple.hpp"
#include <cctype>
#include <stdexcept>
#include <tuple>

namespace kgsynth {

std::string trim(const std::string& text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }

    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }

    return text.substr(start, end - start);
}

std::vector<std::string> split_triple_string(const std::string& text) {
    std::string body = trim(text);
    if (body.size() >= 2 && body.front() == '(' && body.back() == ')') {
        body = body.substr(1, body.size() - 2);
    }

    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t comma = body.find(',', start);
        if (comma == std::string::npos) {
            parts.push_back(trim(body.substr(start)));
            break;
        }
        parts.push_back(trim(body.substr(start, comma - start)));
        start = comma + 1;
    }
    return parts;
}

bool Triple::is_encodable_label(const std::string& label) {
    if (label.find_first_of("(),") != std::string::npos) return false;
    return trim(label) == label;
}

std::string Triple::to_string() const {
    for (const auto* field : {&subject, &predicate, &object}) {
        if (!is_encodable_label(*field)) {
            throw std::invalid_argument("Label cannot be encoded in a triple string: '" + *field + "'");
        }
    }
    return "(" + subject + "," + predicate + "," + object + ")";
}

std::optional<Triple> Triple::parse(const std::string& text) {
    auto parts = split_triple_string(text);
    if (parts.size() != 3) {
        return std::nullopt;
    }
    return Triple{parts[0], parts[1], parts[2]};
}

bool Triple::operator<(const Triple& other) const {
    return std::tie(subject, predicate, object) <
           std::tie(other.subject, other.predicate, other.object);
}

} // namespace kgsynth
