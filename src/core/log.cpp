#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <mutex>

static std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

std::string delta_log_path() {
    static std::string path = (platform::temp_dir() / DELTA_LOG_FILE).string();
    return path;
}

void delta_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(delta_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

void delta_log_ssh(const std::string& label, const std::string& cmd, const SSHResult& r) {
    delta_log(fmt::format("{} CMD: {}", label, cmd));
    delta_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                          r.stdout_data.size(), r.stdout_data.substr(0, LOG_OUTPUT_PREVIEW)));
    if (!r.stderr_data.empty())
        delta_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, LOG_OUTPUT_PREVIEW)));
}
