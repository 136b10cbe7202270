#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace conn_header {

// A validated DNS name, stored lowercase and without a trailing dot.
class Name {
public:
    static constexpr std::size_t kMaxLength = 253;
    static constexpr std::size_t kMaxLabelLength = 63;

    // Returns std::nullopt when `text` is not a usable DNS name.
    static std::optional<Name> parse(std::string_view text);

    const std::string& str() const noexcept { return value_; }

    friend bool operator==(const Name& a, const Name& b) noexcept { return a.value_ == b.value_; }
    friend bool operator!=(const Name& a, const Name& b) noexcept { return !(a == b); }

private:
    explicit Name(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

std::ostream& operator<<(std::ostream& os, const Name& name);

} // namespace conn_header
