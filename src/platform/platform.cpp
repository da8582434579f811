#include "platform.hpp"
#include <cstdlib>
#include <pwd.h>
#include <grp.h>
#include <unistd.h>
#include <sys/statvfs.h>
#include <climits>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home);
    struct passwd* pw = getpwuid(geteuid());
    if (pw && pw->pw_dir) return fs::path(pw->pw_dir);
    return temp_dir();
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path expand_user(const std::string& path) {
    if (path == "~") return home_dir();
    if (path.rfind("~/", 0) == 0) return home_dir() / path.substr(2);
    return fs::path(path);
}

std::string current_user() {
    struct passwd* pw = getpwuid(geteuid());
    return (pw && pw->pw_name) ? std::string(pw->pw_name) : std::string();
}

std::string current_group() {
    struct group* gr = getgrgid(getegid());
    return (gr && gr->gr_name) ? std::string(gr->gr_name) : std::string();
}

std::string short_hostname() {
    char buf[HOST_NAME_MAX + 1] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0) return "localhost";
    std::string host(buf);
    auto dot = host.find('.');
    if (dot != std::string::npos) host.erase(dot);
    return host;
}

int64_t free_space_bytes(const fs::path& dir) {
    struct statvfs st;
    if (statvfs(dir.c_str(), &st) != 0) return -1;
    return static_cast<int64_t>(st.f_bfree) * static_cast<int64_t>(st.f_frsize);
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
