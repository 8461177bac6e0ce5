#pragma once

/**
 * @file switch_engine.hpp
 * @brief Registry state transitions and launch entry installation
 *
 * Each operation takes the registry by value, applies one transition and
 * returns the updated copy. On error the caller keeps its original value, and
 * the filesystem is left as it was: the launch entry is only touched by the
 * last fallible step of a transition.
 *
 * Per application the states are:
 *   Untracked        no entries
 *   Tracked-Inactive entries exist, no active tag
 *   Tracked-Active   an active tag is set and <bin_dir>/<app> launches it
 */

#include "altb/entry.hpp"
#include "altb/launcher.hpp"
#include "altb/registry.hpp"
#include "altb/settings.hpp"
#include "altb/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace altb {

/// A managed copy written under a staging name, moved to final_path on commit
struct StagedCopy {
    std::string staging_path;
    std::string final_path;
};

/**
 * Registry after a transition. staged_copies are moved into place once the
 * registry is persisted (or deleted if it is not); stale_files are deleted
 * once it is persisted.
 */
struct Mutation {
    Registry registry;
    std::vector<StagedCopy> staged_copies;
    std::vector<std::string> stale_files;
};

/**
 * Insert or overwrite entries[tag] of app_name, creating the application if
 * needed. The active tag is unchanged; when tag is the active tag the launch
 * entry is re-resolved and reinstalled immediately.
 *
 * With copy set (path entries only) the file is copied atomically to a
 * staging name in <versions>/<app>, keeping its permission bits plus owner
 * execute. The entry records <versions>/<app>/<app>_<tag> as its launch
 * target and the staged copy is reported in staged_copies.
 *
 * An overwrite without a description keeps the previous description.
 */
Result<Mutation> track(Registry registry, const Layout& layout, const std::string& app_name,
                       const std::string& tag, Entry entry, bool copy = false);

/**
 * Make tag the active tag of app_name and install its launch entry.
 * Without a tag the current active tag is reinstalled (NO_ACTIVE_TAG if none).
 * Fails with UNKNOWN_APPLICATION, UNKNOWN_TAG, TARGET_MISSING or INSTALL_FAILED.
 */
Result<Registry> use(Registry registry, const Layout& layout, const std::string& app_name,
                     const std::optional<std::string>& tag = std::nullopt, bool force = false);

/// Remove the launch entry and clear the active tag. No-op when nothing is active.
Result<Registry> unlink(Registry registry, const Layout& layout, const std::string& app_name,
                        bool force = false);

/**
 * Remove entries[tag]. An active entry loses its launch entry first. The
 * managed copy of the entry, if any, is reported in stale_files. An
 * application left without entries is removed.
 */
Result<Mutation> untrack(Registry registry, const Layout& layout, const std::string& app_name,
                         const std::string& tag);

/**
 * Move entries[tag] to entries[new_tag]. A managed copy is staged for the new
 * deterministic name (the old file is reported in stale_files). The active
 * tag follows the entry and its launch entry is reinstalled.
 */
Result<Mutation> rename_tag(Registry registry, const Layout& layout, const std::string& app_name,
                            const std::string& tag, const std::string& new_tag);

/// Move every staged copy to its final name. Fails with IO_ERROR.
Result<void> promote_staged_copies(const Mutation& mutation);

/// Delete the staged copies of a transition that was not persisted
void discard_staged_copies(const Mutation& mutation);

/// Symlink targets an application's launch entry may legitimately hold
LaunchOwnership launch_ownership(const Layout& layout, const std::string& app_name,
                                 const Application* app);

/// Set, or clear with nullopt, the description of entries[tag]
Result<Registry> describe(Registry registry, const std::string& app_name, const std::string& tag,
                          const std::optional<std::string>& description);

} // namespace altb
