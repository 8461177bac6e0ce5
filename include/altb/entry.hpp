#pragma once

#include "altb/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>

namespace altb {

/// Extra environment exported before a command runs (ordered for stable output)
using EnvMap = std::map<std::string, std::string>;

/// Visitor helper for exhaustive std::visit over entry variants
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// ============================================================================
// Entry Variants
// ============================================================================

/// A tracked file on disk, optionally copied into managed storage
struct PathEntry {
    std::string source_path;                       // absolute at track time
    std::optional<std::string> managed_copy_path;  // set for --copy
    std::string content_fingerprint;               // "sha256:<hex>", empty for imported entries
};

/// A shell command run in a working directory
struct CommandEntry {
    std::string command_line;
    std::optional<std::string> working_directory;
    EnvMap environment;
};

enum class EntryKind {
    Path,
    Command
};

struct Entry {
    std::variant<PathEntry, CommandEntry> details;
    std::optional<std::string> description;

    EntryKind kind() const {
        return std::holds_alternative<PathEntry>(details) ? EntryKind::Path : EntryKind::Command;
    }
};

bool operator==(const PathEntry& a, const PathEntry& b);
bool operator==(const CommandEntry& a, const CommandEntry& b);
bool operator==(const Entry& a, const Entry& b);
inline bool operator!=(const Entry& a, const Entry& b) { return !(a == b); }

const char* entry_kind_to_string(EntryKind kind);

// ============================================================================
// Resolved Targets
// ============================================================================

/// Launch entry is a symlink to path
struct LinkTarget {
    std::string path;
};

/// Launch entry is a generated launcher script
struct WrapperTarget {
    std::string command_line;
    std::string working_directory;
    EnvMap environment;
};

using ResolvedTarget = std::variant<LinkTarget, WrapperTarget>;

// ============================================================================
// Construction and Resolution
// ============================================================================

/**
 * Build a path entry for an existing, readable regular file.
 * A leading "~" is expanded against home_dir; relative paths are made
 * absolute against the current directory. The content fingerprint is
 * computed here.
 * Fails with SOURCE_NOT_FOUND.
 */
Result<PathEntry> make_path_entry(const std::string& source_path,
                                  const std::string& home_dir = "");

/// Pure construction; fails with EMPTY_COMMAND for a blank command line
Result<CommandEntry> make_command_entry(const std::string& command_line,
                                        const std::optional<std::string>& working_directory = std::nullopt,
                                        const EnvMap& environment = {});

/// The file a path entry launches: the managed copy if any, else the source
const std::string& launch_path(const PathEntry& entry);

/**
 * Resolve an entry to the artifact the launch entry should carry.
 * Path entries fail with TARGET_MISSING when the launched file is gone.
 * Command entries without a working directory get the current directory.
 */
Result<ResolvedTarget> resolve_target(const Entry& entry);

/// One-line human description: path, or "<command> at <dir>"
std::string target_summary(const Entry& entry);

} // namespace altb
