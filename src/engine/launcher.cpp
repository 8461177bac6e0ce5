#include "altb/launcher.hpp"
#include "altb/platform.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace altb {

namespace {

constexpr unsigned kScriptMode = 0755;

Result<void> install_failed(const std::string& message) {
    return Result<void>::err(Error(ErrorCode::INSTALL_FAILED, message));
}

std::string second_line(const std::string& content) {
    auto first = content.find('\n');
    if (first == std::string::npos) return "";
    auto second = content.find('\n', first + 1);
    return content.substr(first + 1, second == std::string::npos ? std::string::npos
                                                                  : second - first - 1);
}

} // namespace

std::string shell_quote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string render_wrapper_script(const std::string& app_name, const std::string& tag,
                                  const WrapperTarget& target) {
    std::ostringstream ss;
    ss << "#!/bin/sh\n";
    ss << kLauncherMarker << " " << app_name << "@" << tag << "\n";
    if (!target.working_directory.empty()) {
        ss << "cd " << shell_quote(target.working_directory) << " || exit 1\n";
    }
    for (const auto& [key, value] : target.environment) {
        ss << "export " << key << "=" << shell_quote(value) << "\n";
    }
    // The command is interpreted by sh; forwarded arguments follow it
    ss << "exec /bin/sh -c " << shell_quote(target.command_line + " \"$@\"") << " "
       << shell_quote(app_name) << " \"$@\"\n";
    return ss.str();
}

LaunchArtifact make_launch_artifact(const std::string& app_name, const std::string& tag,
                                    const ResolvedTarget& target) {
    return std::visit(overloaded{
        [](const LinkTarget& link) {
            return LaunchArtifact{LaunchArtifact::Kind::Symlink, link.path};
        },
        [&](const WrapperTarget& wrapper) {
            return LaunchArtifact{LaunchArtifact::Kind::Script,
                                  render_wrapper_script(app_name, tag, wrapper)};
        },
    }, target);
}

bool is_managed_launch_entry(const std::string& path, const LaunchOwnership& ownership) {
    if (!entry_exists(path)) return true;
    if (is_symlink(path)) {
        auto target = read_symlink(path);
        if (!target) return false;
        for (const auto& known : ownership.known_targets) {
            if (*target == known) return true;
        }
        return !ownership.managed_directory.empty() &&
               is_path_under(*target, ownership.managed_directory);
    }
    if (!is_regular_file(path)) return false;

    auto content = read_file(path);
    if (!content) return false;
    return second_line(*content).rfind(kLauncherMarker, 0) == 0;
}

Result<void> install_launch_entry(const Layout& layout, const std::string& app_name,
                                  const LaunchArtifact& artifact,
                                  const LaunchOwnership& ownership, bool force) {
    if (!create_directories(layout.bin_dir)) {
        return install_failed("cannot create binary directory " + layout.bin_dir);
    }

    std::string destination = launch_entry_path(layout, app_name);
    if (!force && !is_managed_launch_entry(destination, ownership)) {
        return install_failed(destination + " exists and is not managed by altb; "
                              "remove it or use --force");
    }

    AtomicWriteResult written;
    switch (artifact.kind) {
        case LaunchArtifact::Kind::Symlink:
            written = atomic_update_symlink(destination, artifact.payload);
            break;
        case LaunchArtifact::Kind::Script:
            written = atomic_write_file(destination, artifact.payload, kScriptMode);
            break;
    }

    if (!written.ok) {
        return install_failed(written.error);
    }

    spdlog::debug("installed {} ({})", destination,
                  artifact.kind == LaunchArtifact::Kind::Symlink ? "-> " + artifact.payload
                                                                 : std::string("launcher script"));
    return Result<void>::ok();
}

InstalledEntry read_launch_entry(const Layout& layout, const std::string& app_name) {
    InstalledEntry entry;
    std::string path = launch_entry_path(layout, app_name);
    if (!entry_exists(path)) return entry;

    entry.present = true;
    if (is_symlink(path)) {
        entry.is_symlink = true;
        entry.content = read_symlink(path).value_or("");
    } else {
        entry.content = read_file(path).value_or("");
    }
    return entry;
}

Result<void> restore_launch_entry(const Layout& layout, const std::string& app_name,
                                  const InstalledEntry& previous) {
    if (!previous.present) {
        return remove_launch_entry(layout, app_name, LaunchOwnership{}, true);
    }
    LaunchArtifact artifact{previous.is_symlink ? LaunchArtifact::Kind::Symlink
                                                : LaunchArtifact::Kind::Script,
                            previous.content};
    return install_launch_entry(layout, app_name, artifact, LaunchOwnership{}, true);
}

Result<void> remove_launch_entry(const Layout& layout, const std::string& app_name,
                                 const LaunchOwnership& ownership, bool force) {
    std::string path = launch_entry_path(layout, app_name);
    if (!entry_exists(path)) return Result<void>::ok();

    if (!force && !is_managed_launch_entry(path, ownership)) {
        return install_failed(path + " is not managed by altb; remove it manually");
    }
    if (!remove_file(path)) {
        return install_failed("failed to remove " + path);
    }

    spdlog::debug("removed {}", path);
    return Result<void>::ok();
}

} // namespace altb
