#pragma once

#include "altb/types.hpp"

#include <optional>
#include <string>

namespace altb {

// ============================================================================
// Layout
// ============================================================================

/// Filesystem locations the engine mutates
struct Layout {
    std::string bin_dir;        // personal binary directory (launch entries)
    std::string versions_dir;   // managed storage root (one subdirectory per app)
    std::string home_dir;       // used to expand "~" in tracked paths
};

/// Directory holding managed copies for one application
std::string managed_app_directory(const Layout& layout, const std::string& app_name);

/// Deterministic managed copy location: <versions>/<app>/<app>_<tag>
std::string managed_copy_path_for(const Layout& layout, const std::string& app_name,
                                  const std::string& tag);

/// Launch entry location: <bin_dir>/<app>
std::string launch_entry_path(const Layout& layout, const std::string& app_name);

// ============================================================================
// Settings
// ============================================================================

/// Explicit overrides, typically from command-line flags
struct SettingsOverrides {
    std::optional<std::string> config_path;
    std::optional<std::string> bin_dir;
    std::optional<std::string> data_dir;
};

struct Settings {
    std::string home_dir;
    std::string config_path;
    std::string legacy_config_path;   // config.yaml of older releases; empty if not consulted
    std::string bin_dir;
    std::string data_dir;

    std::string versions_dir() const { return data_dir + "/versions"; }
    Layout layout() const { return Layout{bin_dir, versions_dir(), home_dir}; }
};

/**
 * Resolve settings.
 * Priority per value: override > ALTB_* environment variable > default under home.
 * Home is ALTB_HOME_PATH, then HOME. Fails with IO_ERROR if no home can be found
 * and some value still needs a default. legacy_config_path is only set when the
 * registry location is the default one.
 */
Result<Settings> resolve_settings(const SettingsOverrides& overrides = {});

} // namespace altb
