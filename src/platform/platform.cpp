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
    return fs::temp_directory_path();
}

std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

fs::path find_in_path(const std::string& program) {
    if (program.empty()) return {};
    if (program.find('/') != std::string::npos) {
        return access(program.c_str(), X_OK) == 0 ? fs::path(program) : fs::path();
    }

    std::string path = env_or_empty("PATH");
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";
        fs::path candidate = fs::path(dir) / program;
        std::error_code ec;
        if (access(candidate.c_str(), X_OK) == 0 && !fs::is_directory(candidate, ec)) {
            return candidate;
        }
        start = end + 1;
    }
    return {};
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
