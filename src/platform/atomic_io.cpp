#include "altb/platform.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <random>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace altb {

namespace {

// fsync a file descriptor
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}

// Generate a temporary filename in the same directory as base
std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    std::string dir = get_parent_directory(base);
    std::string name = "." + get_filename(base) + ".tmp." + suffix;
    return dir.empty() ? name : dir + "/" + name;
}

std::string errno_message(const std::string& what) {
    return what + ": " + std::string(strerror(errno));
}

// Write all bytes, retrying short writes
bool write_all(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t written = write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += written;
        size -= static_cast<size_t>(written);
    }
    return true;
}

// Rename temp over path and fsync the directory; unlinks temp on failure
AtomicWriteResult commit_temp(const std::string& temp_path, const std::string& path) {
    AtomicWriteResult result;

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        result.error = errno_message("failed to rename " + temp_path + " to " + path);
        unlink(temp_path.c_str());
        return result;
    }

    std::string dir_path = get_parent_directory(path);
    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
    return result;
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content,
                                    unsigned mode) {
    AtomicWriteResult result;
    std::string temp_path = make_temp_filename(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
    if (fd < 0) {
        result.error = errno_message("failed to create temp file " + temp_path);
        return result;
    }

    if (!write_all(fd, content.data(), content.size())) {
        result.error = errno_message("failed to write " + temp_path);
        close(fd);
        unlink(temp_path.c_str());
        return result;
    }

    // open() applies the umask, so set the final mode explicitly
    if (fchmod(fd, static_cast<mode_t>(mode)) != 0) {
        result.error = errno_message("failed to chmod " + temp_path);
        close(fd);
        unlink(temp_path.c_str());
        return result;
    }

    if (!fsync_fd(fd)) {
        result.error = errno_message("failed to fsync " + temp_path);
        close(fd);
        unlink(temp_path.c_str());
        return result;
    }

    close(fd);

    return commit_temp(temp_path, path);
}

AtomicWriteResult atomic_update_symlink(const std::string& link_path, const std::string& target) {
    AtomicWriteResult result;
    std::string temp_path = make_temp_filename(link_path);

    if (symlink(target.c_str(), temp_path.c_str()) != 0) {
        result.error = errno_message("failed to create symlink " + temp_path);
        return result;
    }

    return commit_temp(temp_path, link_path);
}

AtomicWriteResult atomic_copy_file(const std::string& src, const std::string& dst,
                                   unsigned extra_mode) {
    AtomicWriteResult result;

    int in_fd = open(src.c_str(), O_RDONLY);
    if (in_fd < 0) {
        result.error = errno_message("failed to open " + src);
        return result;
    }

    struct stat st;
    if (fstat(in_fd, &st) != 0) {
        result.error = errno_message("failed to stat " + src);
        close(in_fd);
        return result;
    }

    std::string temp_path = make_temp_filename(dst);
    int out_fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
    if (out_fd < 0) {
        result.error = errno_message("failed to create temp file " + temp_path);
        close(in_fd);
        return result;
    }

    char buffer[8192];
    for (;;) {
        ssize_t n = read(in_fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            result.error = errno_message("failed to read " + src);
            break;
        }
        if (n == 0) break;
        if (!write_all(out_fd, buffer, static_cast<size_t>(n))) {
            result.error = errno_message("failed to write " + temp_path);
            break;
        }
    }
    close(in_fd);

    if (result.error.empty()) {
        mode_t mode = (st.st_mode & 07777) | static_cast<mode_t>(extra_mode);
        if (fchmod(out_fd, mode) != 0) {
            result.error = errno_message("failed to chmod " + temp_path);
        } else if (!fsync_fd(out_fd)) {
            result.error = errno_message("failed to fsync " + temp_path);
        }
    }

    close(out_fd);

    if (!result.error.empty()) {
        unlink(temp_path.c_str());
        return result;
    }

    return commit_temp(temp_path, dst);
}

} // namespace altb
