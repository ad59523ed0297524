#pragma once

#include <string>
#include <optional>
#include <cstdint>

// Strict unsigned 16-bit parse: optional leading '+', decimal digits, no whitespace, <= 65535.
std::optional<uint16_t> parse_u16(const std::string& s);

// Parse a process id; only strictly positive values are accepted.
std::optional<uint64_t> parse_pid(const std::string& s);

// Quote a value for safe interpolation into a POSIX shell command.
std::string shell_quote(const std::string& value);

// Split "host:port" (or "[v6]:port"); port falls back to default_port.
struct HostPort {
    std::string host;
    int port;
};
std::optional<HostPort> parse_address(const std::string& address, int default_port);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}
