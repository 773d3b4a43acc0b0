#include <sfnet/NodeId.hpp>

#include <cerrno>
#include <cstdlib>
#include <ostream>

namespace sfnet {

std::string NodeId::label() const {
    if (is_integer())
        return std::to_string(as_integer());
    return as_string();
}

std::string NodeId::to_string() const {
    if (is_integer())
        return std::to_string(as_integer());
    return "'" + as_string() + "'";
}

NodeId NodeId::parse(const std::string &token) {
    if (token.size() >= 2 && token.front() == '\'' && token.back() == '\'')
        return NodeId{token.substr(1, token.size() - 2)};

    const size_t first_digit = (!token.empty() && token[0] == '-') ? 1 : 0;
    if (token.size() == first_digit)
        return NodeId{token};

    for (size_t i = first_digit; i < token.size(); ++i) {
        if (token[i] < '0' || token[i] > '9')
            return NodeId{token};
    }

    errno = 0;
    char *end = nullptr;
    const long long value = std::strtoll(token.c_str(), &end, 10);
    if (errno == ERANGE)
        return NodeId{token};

    return NodeId{static_cast<std::int64_t>(value)};
}

int NodeId::compare(const NodeId &other) const noexcept {
    // every integer precedes every string
    if (value_.index() != other.value_.index())
        return value_.index() < other.value_.index() ? -1 : 1;

    if (is_integer()) {
        const auto a = std::get<std::int64_t>(value_);
        const auto b = std::get<std::int64_t>(other.value_);
        return (a > b) - (a < b);
    }

    const int cmp = std::get<std::string>(value_).compare(std::get<std::string>(other.value_));
    return (cmp > 0) - (cmp < 0);
}

std::size_t NodeId::hash() const noexcept {
    if (is_integer())
        return std::hash<std::int64_t>{}(std::get<std::int64_t>(value_));
    return std::hash<std::string>{}(std::get<std::string>(value_));
}

std::ostream &operator<<(std::ostream &os, const NodeId &id) {
    return os << id.to_string();
}

}
