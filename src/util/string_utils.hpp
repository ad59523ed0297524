#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace StringUtils {
// Split on runs of whitespace; empty tokens are dropped.
std::vector<std::string> split(const std::string& str);
std::string trim(const std::string& str);

// "key=value" -> {key, value}; nullopt if there is no '=' or the key is empty.
std::optional<std::pair<std::string, std::string>> parse_assignment(const std::string& token);
}
