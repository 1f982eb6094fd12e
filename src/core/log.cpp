#include "log.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>

namespace {

std::mutex& log_mutex() {
    static std::mutex mtx;
    return mtx;
}

std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / "hostlink_debug.log").string();
    return path;
}

} // namespace

std::string hostlink_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_path_storage();
}

void set_hostlink_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_storage() = path;
}

void hostlink_log(const std::string& msg) {
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

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(log_path_storage(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

void hostlink_log_ssh(const std::string& label, const std::string& cmd, const SSHResult& r) {
    hostlink_log(fmt::format("{} CMD: {}", label, cmd));
    hostlink_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                             r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        hostlink_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
