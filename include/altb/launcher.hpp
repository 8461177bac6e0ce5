#pragma once

#include "altb/entry.hpp"
#include "altb/settings.hpp"
#include "altb/types.hpp"

#include <string>
#include <vector>

namespace altb {

// ============================================================================
// Launch Artifacts
// ============================================================================

/// Second line of every generated launcher script; marks it as altb-managed
constexpr const char* kLauncherMarker = "# altb launcher:";

/// What ends up at <bin_dir>/<app>: a symlink or a file with content
struct LaunchArtifact {
    enum class Kind { Symlink, Script };

    Kind kind = Kind::Symlink;
    std::string payload;   // symlink target, or script bytes
};

/// Quote a string for POSIX sh using single quotes
std::string shell_quote(const std::string& value);

/// Render the launcher script for a command target
std::string render_wrapper_script(const std::string& app_name, const std::string& tag,
                                  const WrapperTarget& target);

/// Build the artifact that represents a resolved target
LaunchArtifact make_launch_artifact(const std::string& app_name, const std::string& tag,
                                    const ResolvedTarget& target);

// ============================================================================
// Installation
// ============================================================================

/// Symlink targets altb may have installed for one application
struct LaunchOwnership {
    std::string managed_directory;            // <versions>/<app>
    std::vector<std::string> known_targets;   // launch paths of the app's path entries
};

/**
 * True if the entry at path may be replaced: absent, a launcher script
 * carrying the altb marker, or a symlink whose target is one of the known
 * targets or lies under the managed directory.
 */
bool is_managed_launch_entry(const std::string& path, const LaunchOwnership& ownership);

/**
 * Atomically replace <bin_dir>/<app> with the artifact.
 * The artifact is created under a temporary name in bin_dir and renamed over
 * the final name. bin_dir is created if missing. An existing entry that is not
 * managed by altb is refused unless force is set.
 * Fails with INSTALL_FAILED.
 */
Result<void> install_launch_entry(const Layout& layout, const std::string& app_name,
                                  const LaunchArtifact& artifact,
                                  const LaunchOwnership& ownership, bool force = false);

/// What is currently installed for an application, if anything
struct InstalledEntry {
    bool present = false;
    bool is_symlink = false;
    std::string content;   // symlink target or file content
};

InstalledEntry read_launch_entry(const Layout& layout, const std::string& app_name);

/// Restore a previously read state (used to roll back a failed transition)
Result<void> restore_launch_entry(const Layout& layout, const std::string& app_name,
                                  const InstalledEntry& previous);

/// Remove <bin_dir>/<app> if present and managed. Fails with INSTALL_FAILED.
Result<void> remove_launch_entry(const Layout& layout, const std::string& app_name,
                                 const LaunchOwnership& ownership, bool force = false);

} // namespace altb
