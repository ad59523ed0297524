#include "utils.hpp"
#include <limits>

// One optional leading '+', then decimal digits only
static std::optional<uint64_t> parse_digits(const std::string& s, uint64_t max) {
    size_t start = (!s.empty() && s[0] == '+') ? 1 : 0;
    if (s.size() == start || s.size() - start > 20) return std::nullopt;
    uint64_t value = 0;
    for (char c : s.substr(start)) {
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (max - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

std::optional<uint16_t> parse_u16(const std::string& s) {
    auto v = parse_digits(s, std::numeric_limits<uint16_t>::max());
    if (!v) return std::nullopt;
    return static_cast<uint16_t>(*v);
}

std::optional<uint64_t> parse_pid(const std::string& s) {
    auto v = parse_digits(s, std::numeric_limits<uint64_t>::max());
    if (!v || *v == 0) return std::nullopt;
    return v;
}

std::string shell_quote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::optional<HostPort> parse_address(const std::string& address, int default_port) {
    if (address.empty()) return std::nullopt;

    // Bracketed IPv6: [::1]:22
    if (address.front() == '[') {
        auto close = address.find(']');
        if (close == std::string::npos || close == 1) return std::nullopt;
        std::string host = address.substr(1, close - 1);
        if (close + 1 == address.size()) return HostPort{host, default_port};
        if (address[close + 1] != ':') return std::nullopt;
        auto port = parse_u16(address.substr(close + 2));
        if (!port || *port == 0) return std::nullopt;
        return HostPort{host, *port};
    }

    auto colon = address.rfind(':');
    // More than one colon without brackets: bare IPv6 literal
    if (colon == std::string::npos || address.find(':') != colon) {
        return HostPort{address, default_port};
    }

    std::string host = address.substr(0, colon);
    if (host.empty()) return std::nullopt;
    auto port = parse_u16(address.substr(colon + 1));
    if (!port || *port == 0) return std::nullopt;
    return HostPort{host, *port};
}
