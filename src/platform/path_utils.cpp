#include "altb/platform.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace altb {

namespace fs = std::filesystem;

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return p.string();
}

std::string expand_user(const std::string& path, const std::string& home) {
    if (path == "~") return home;
    if (path.rfind("~/", 0) == 0) return join_path(home, path.substr(2));
    return path;
}

std::string make_absolute(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) return path;
    return abs.lexically_normal().string();
}

bool is_path_under(const std::string& path, const std::string& root) {
    fs::path p = fs::path(path).lexically_normal();
    fs::path r = fs::path(root).lexically_normal();
    fs::path rel = p.lexically_relative(r);
    if (rel.empty() || rel == ".") return false;
    return *rel.begin() != "..";
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

bool is_symlink(const std::string& path) {
    std::error_code ec;
    return fs::is_symlink(path, ec);
}

bool entry_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

bool is_readable(const std::string& path) {
    return access(path.c_str(), R_OK) == 0;
}

std::optional<std::string> read_symlink(const std::string& path) {
    std::error_code ec;
    auto target = fs::read_symlink(path, ec);
    if (ec) return std::nullopt;
    return target.string();
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

bool rename_file(const std::string& from, const std::string& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    return !ec;
}

std::string current_directory() {
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) return ".";
    return cwd.string();
}

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
}

} // namespace altb
