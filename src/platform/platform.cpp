#include "platform.hpp"
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <random>
#include <system_error>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path temp_file(const std::string& prefix, const std::string& extension) {
    // pid + random keeps concurrent engines apart
    static std::mutex mtx;
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)) ^
                            static_cast<unsigned>(reinterpret_cast<uintptr_t>(&mtx)));
    std::uniform_int_distribution<int> dist(100000, 999999);

    std::lock_guard<std::mutex> lock(mtx);
    while (true) {
#ifdef _WIN32
        auto pid = static_cast<long>(GetCurrentProcessId());
#else
        auto pid = static_cast<long>(getpid());
#endif
        fs::path p = temp_dir() / (prefix + "_" + std::to_string(pid) + "_" +
                                   std::to_string(dist(rng)) + extension);
        std::error_code ec;
        if (!fs::exists(p, ec)) return p;
    }
}

int64_t local_file_size(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return -1;
    return static_cast<int64_t>(size);
}

bool remove_quietly(const fs::path& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

void sleep_ms(int ms) {
#ifdef _WIN32
    Sleep(ms);
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

} // namespace platform
