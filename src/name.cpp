#include "name.hpp"

#include <algorithm>
#include <cctype>

namespace conn_header {

namespace {

bool is_label_char(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_';
}

bool valid_label(std::string_view label) {
    if (label.empty() || label.size() > Name::kMaxLabelLength) return false;
    if (label.front() == '-' || label.back() == '-') return false;
    return std::all_of(label.begin(), label.end(),
                       [](char c) { return is_label_char(static_cast<unsigned char>(c)); });
}

} // namespace

std::optional<Name> Name::parse(std::string_view text) {
    if (!text.empty() && text.back() == '.') {
        text.remove_suffix(1);
    }
    if (text.empty() || text.size() > kMaxLength) return std::nullopt;

    std::string_view last;
    std::size_t start = 0;
    while (true) {
        const auto dot = text.find('.', start);
        const auto label = text.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        if (!valid_label(label)) return std::nullopt;
        last = label;
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }

    // An all-numeric final label would make this an IP literal.
    if (std::all_of(last.begin(), last.end(),
                    [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        return std::nullopt;
    }

    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return Name(std::move(lowered));
}

std::ostream& operator<<(std::ostream& os, const Name& name) {
    return os << name.str();
}

} // namespace conn_header
