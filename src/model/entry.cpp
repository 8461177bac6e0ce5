#include "altb/entry.hpp"
#include "altb/tag_resolver.hpp"
#include "altb/platform.hpp"

#include <algorithm>
#include <cctype>

namespace altb {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

} // namespace

bool operator==(const PathEntry& a, const PathEntry& b) {
    return a.source_path == b.source_path &&
           a.managed_copy_path == b.managed_copy_path &&
           a.content_fingerprint == b.content_fingerprint;
}

bool operator==(const CommandEntry& a, const CommandEntry& b) {
    return a.command_line == b.command_line &&
           a.working_directory == b.working_directory &&
           a.environment == b.environment;
}

bool operator==(const Entry& a, const Entry& b) {
    return a.details == b.details && a.description == b.description;
}

const char* entry_kind_to_string(EntryKind kind) {
    switch (kind) {
        case EntryKind::Path: return "path";
        case EntryKind::Command: return "command";
    }
    return "unknown";
}

Result<PathEntry> make_path_entry(const std::string& source_path,
                                  const std::string& home_dir) {
    if (source_path.empty()) {
        return Result<PathEntry>::err(Error(ErrorCode::SOURCE_NOT_FOUND, "empty source path"));
    }

    std::string path = source_path;
    if (!home_dir.empty()) {
        path = expand_user(path, home_dir);
    }
    path = make_absolute(path);

    if (!path_exists(path)) {
        return Result<PathEntry>::err(Error(ErrorCode::SOURCE_NOT_FOUND,
                                            "path doesn't exist: " + path));
    }
    if (!is_regular_file(path)) {
        return Result<PathEntry>::err(Error(ErrorCode::SOURCE_NOT_FOUND,
                                            "not a regular file: " + path));
    }
    if (!is_readable(path)) {
        return Result<PathEntry>::err(Error(ErrorCode::SOURCE_NOT_FOUND,
                                            "file is not readable: " + path));
    }

    auto fingerprint = fingerprint_file(path);
    if (fingerprint.isErr()) {
        return Result<PathEntry>::err(Error(ErrorCode::SOURCE_NOT_FOUND,
                                            fingerprint.error().message()));
    }

    PathEntry entry;
    entry.source_path = path;
    entry.content_fingerprint = fingerprint.value();
    return Result<PathEntry>::ok(entry);
}

Result<CommandEntry> make_command_entry(const std::string& command_line,
                                        const std::optional<std::string>& working_directory,
                                        const EnvMap& environment) {
    if (is_blank(command_line)) {
        return Result<CommandEntry>::err(Error(ErrorCode::EMPTY_COMMAND, "command line is empty"));
    }
    for (const auto& kv : environment) {
        auto name_check = validate_env_name(kv.first);
        if (name_check.isErr()) return Result<CommandEntry>::err(name_check.error());
    }

    CommandEntry entry;
    entry.command_line = command_line;
    if (working_directory && !working_directory->empty()) {
        entry.working_directory = working_directory;
    }
    entry.environment = environment;
    return Result<CommandEntry>::ok(entry);
}

const std::string& launch_path(const PathEntry& entry) {
    return entry.managed_copy_path ? *entry.managed_copy_path : entry.source_path;
}

Result<ResolvedTarget> resolve_target(const Entry& entry) {
    return std::visit(overloaded{
        [](const PathEntry& p) -> Result<ResolvedTarget> {
            const std::string& path = launch_path(p);
            if (!path_exists(path)) {
                return Result<ResolvedTarget>::err(Error(ErrorCode::TARGET_MISSING,
                                                         "target no longer exists: " + path));
            }
            return Result<ResolvedTarget>::ok(LinkTarget{path});
        },
        [](const CommandEntry& c) -> Result<ResolvedTarget> {
            WrapperTarget wrapper;
            wrapper.command_line = c.command_line;
            wrapper.working_directory = c.working_directory ? *c.working_directory
                                                            : current_directory();
            wrapper.environment = c.environment;
            return Result<ResolvedTarget>::ok(wrapper);
        },
    }, entry.details);
}

std::string target_summary(const Entry& entry) {
    return std::visit(overloaded{
        [](const PathEntry& p) -> std::string {
            return launch_path(p);
        },
        [](const CommandEntry& c) -> std::string {
            return c.command_line + " at " +
                   (c.working_directory ? *c.working_directory : std::string("<current directory>"));
        },
    }, entry.details);
}

} // namespace altb
