#include "platform.hpp"
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    auto p = fs::temp_directory_path(ec);
    if (ec) return fs::path("/tmp");
    return p;
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
