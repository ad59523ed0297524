#include "string_utils.hpp"
#include <sstream>

namespace StringUtils {

std::vector<std::string> split(const std::string& str) {
    std::vector<std::string> out;
    std::istringstream iss(str);
    std::string token;
    while (iss >> token) out.push_back(token);
    return out;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::optional<std::pair<std::string, std::string>> parse_assignment(const std::string& token) {
    auto eq = token.find('=');
    if (eq == std::string::npos || eq == 0) return std::nullopt;
    return std::make_pair(token.substr(0, eq), token.substr(eq + 1));
}

}
