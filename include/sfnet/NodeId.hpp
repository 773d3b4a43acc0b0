#pragma once
#ifndef SFNET_NODEID_HPP
#define SFNET_NODEID_HPP

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace sfnet {

//! Identifier of a node: either an integer or a string.
//! Integers sort numerically and before all strings; strings sort lexicographically.
class NodeId {
    // bool and character types are not identifiers
    template<typename T>
    static constexpr bool is_integer_type = std::is_integral_v<T>
                                            && !std::is_same_v<T, bool>
                                            && !std::is_same_v<T, char>
                                            && !std::is_same_v<T, wchar_t>
                                            && !std::is_same_v<T, char16_t>
                                            && !std::is_same_v<T, char32_t>;

    template<typename Integral>
    static std::int64_t checked_integer(Integral value) {
        if constexpr (std::is_unsigned_v<Integral> && sizeof(Integral) >= sizeof(std::int64_t)) {
            if (value > static_cast<std::make_unsigned_t<std::int64_t>>(std::numeric_limits<std::int64_t>::max()))
                throw std::out_of_range("Error: node identifier " + std::to_string(value) + " exceeds the int64 range");
        }
        return static_cast<std::int64_t>(value);
    }

public:
    using value_type = std::variant<std::int64_t, std::string>;

    //! throws std::out_of_range for unsigned values above INT64_MAX
    template<typename Integral, typename = std::enable_if_t<is_integer_type<Integral>>>
    NodeId(Integral value) : value_(checked_integer(value)) {}

    NodeId(std::string value) : value_(std::move(value)) {}

    NodeId(const char *value) : value_(std::string(value)) {}

    [[nodiscard]] bool is_integer() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool is_string() const noexcept { return value_.index() == 1; }

    //! precondition: is_integer()
    [[nodiscard]] std::int64_t as_integer() const { return std::get<std::int64_t>(value_); }

    //! precondition: is_string()
    [[nodiscard]] const std::string &as_string() const { return std::get<std::string>(value_); }

    //! plain rendering, strings without quotes
    [[nodiscard]] std::string label() const;

    //! rendering that keeps 1 and '1' apart: strings are quoted
    [[nodiscard]] std::string to_string() const;

    //! Inverse of to_string(): a token enclosed in single quotes is the string between them.
    //! Otherwise an integer if the token is an optional '-' followed by decimal digits (and fits),
    //! a string if not.
    static NodeId parse(const std::string &token);

    //! <0, 0, >0 following the order described above
    [[nodiscard]] int compare(const NodeId &other) const noexcept;

    [[nodiscard]] std::size_t hash() const noexcept;

    friend bool operator==(const NodeId &a, const NodeId &b) noexcept { return a.compare(b) == 0; }
    friend bool operator!=(const NodeId &a, const NodeId &b) noexcept { return a.compare(b) != 0; }
    friend bool operator<(const NodeId &a, const NodeId &b) noexcept { return a.compare(b) < 0; }
    friend bool operator>(const NodeId &a, const NodeId &b) noexcept { return a.compare(b) > 0; }
    friend bool operator<=(const NodeId &a, const NodeId &b) noexcept { return a.compare(b) <= 0; }
    friend bool operator>=(const NodeId &a, const NodeId &b) noexcept { return a.compare(b) >= 0; }

private:
    value_type value_;
};

std::ostream &operator<<(std::ostream &os, const NodeId &id);

}

namespace std {
template<>
struct hash<sfnet::NodeId> {
    size_t operator()(const sfnet::NodeId &id) const noexcept { return id.hash(); }
};
}

#endif // SFNET_NODEID_HPP
