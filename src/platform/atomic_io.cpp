#include "steward/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

extern "C" char** environ;

namespace steward {

namespace fs = std::filesystem;

namespace {

bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync(dir_fd) == 0;
    close(dir_fd);
    return result;
}

std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}

// Pick <archive_dir>/<name>_<ts>_<reason>, adding -N when taken
std::string unique_archive_target(const std::string& archive_dir,
                                  const std::string& name,
                                  const std::string& reason) {
    std::string base = join_path(archive_dir, name + "_" + get_archive_timestamp() + "_" + reason);
    std::string candidate = base;
    for (int n = 1; fs::exists(candidate); ++n) {
        candidate = base + "-" + std::to_string(n);
    }
    return candidate;
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;

    std::string dir_path = get_parent_directory(path);
    if (!dir_path.empty() && !create_directories(dir_path)) {
        result.error = "failed to create directory: " + dir_path;
        return result;
    }

    std::string temp_path = make_temp_filename(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file for " + path + ": " + std::string(strerror(errno));
        return result;
    }

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = write(fd, data, remaining);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            int saved = errno;
            close(fd);
            unlink(temp_path.c_str());
            result.error = "failed to write " + path + ": " + std::string(strerror(saved));
            return result;
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }

    if (fsync(fd) != 0) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file for " + path;
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
    return result;
}

std::string get_archive_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm_buf);
    return buf;
}

Result<std::string> archive_path(const std::string& path,
                                 const std::string& archive_dir,
                                 const std::string& reason) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<std::string>::err(Error(ErrorCode::NOT_FOUND, "nothing to archive at " + path));
    }
    if (!create_directories(archive_dir)) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR, "cannot create archive directory " + archive_dir));
    }

    std::string target = unique_archive_target(archive_dir, get_filename(path), reason);

    fs::rename(path, target, ec);
    if (ec) {
        // Cross-device: copy then remove the original
        ec.clear();
        fs::copy(path, target, fs::copy_options::recursive, ec);
        if (ec) {
            return Result<std::string>::err(Error(ErrorCode::IO_ERROR,
                "failed to archive " + path + ": " + ec.message()));
        }
        fs::remove_all(path, ec);
        if (ec) {
            return Result<std::string>::err(Error(ErrorCode::IO_ERROR,
                "archived " + path + " but could not remove it: " + ec.message()));
        }
    }

    fsync_directory(archive_dir);
    return Result<std::string>::ok(target);
}

Result<std::string> archive_content(const std::string& name,
                                    const std::string& content,
                                    const std::string& archive_dir,
                                    const std::string& reason) {
    if (!create_directories(archive_dir)) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR, "cannot create archive directory " + archive_dir));
    }
    std::string target = unique_archive_target(archive_dir, name, reason);
    auto write_result = atomic_write_file(target, content);
    if (!write_result.ok) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR, write_result.error));
    }
    return Result<std::string>::ok(target);
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    if (!p.has_filename()) p = p.parent_path();
    return p.filename().string();
}

std::string get_stem(const std::string& path) {
    return fs::path(get_filename(path)).stem().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return p.string();
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;

    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;

    for (const auto& entry : fs::directory_iterator(path, ec)) {
        entries.push_back(entry.path().filename().string());
    }

    std::sort(entries.begin(), entries.end());
    return entries;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
}

std::unordered_map<std::string, std::string> get_all_env() {
    std::unordered_map<std::string, std::string> env;

    for (char** ep = environ; *ep; ++ep) {
        std::string entry(*ep);
        auto eq = entry.find('=');
        if (eq != std::string::npos) {
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }

    return env;
}

std::string get_home_directory() {
    auto home = get_env("HOME");
    if (home && !home->empty()) return *home;

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) return pw->pw_dir;

    return ".";
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // Version 4
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // Variant 1

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace steward
