#pragma once

/**
 * @file switcher.hpp
 * @brief Main altb library interface
 *
 * Switcher runs every operation as one load -> mutate -> save cycle over a
 * RegistryStore. A failed operation saves nothing and leaves the launch
 * entry of the application as it was.
 *
 * @example
 * ```cpp
 * #include <altb/switcher.hpp>
 *
 * auto settings = altb::resolve_settings();
 * altb::FileRegistryStore store(settings.value().config_path);
 * altb::Switcher switcher(settings.value().layout(), store);
 *
 * switcher.track_path("python", std::string("2.7"), "/usr/bin/python2.7");
 * switcher.track_path("python", std::string("3.8"), "/usr/bin/python3.8");
 * auto used = switcher.use("python", std::string("3.8"));
 * if (used.isErr()) {
 *     std::cerr << used.error().message() << "\n";
 * }
 * ```
 */

#include "altb/entry.hpp"
#include "altb/launcher.hpp"
#include "altb/query.hpp"
#include "altb/registry.hpp"
#include "altb/registry_store.hpp"
#include "altb/settings.hpp"
#include "altb/switch_engine.hpp"
#include "altb/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace altb {

class Switcher {
public:
    Switcher(Layout layout, RegistryStore& store)
        : layout_(std::move(layout)), store_(store) {}

    const Layout& layout() const { return layout_; }

    /**
     * @brief Track a file under app_name
     * @param tag Explicit tag, or nullopt to derive one from the file content
     * @param copy Copy the file into managed storage and launch the copy
     * @return The tag the entry was stored under
     */
    Result<std::string> track_path(const std::string& app_name,
                                   const std::optional<std::string>& tag,
                                   const std::string& path,
                                   bool copy = false,
                                   const std::optional<std::string>& description = std::nullopt);

    /// Track a shell command; a tag is required (MISSING_TAG otherwise)
    Result<void> track_command(const std::string& app_name,
                               const std::optional<std::string>& tag,
                               const std::string& command_line,
                               const std::optional<std::string>& working_directory = std::nullopt,
                               const EnvMap& environment = {},
                               const std::optional<std::string>& description = std::nullopt);

    /**
     * @brief Point the launch entry of app_name at tag
     * @param tag Tag to activate, or nullopt to reinstall the active tag
     * @param force Replace a launch entry that altb does not manage
     * @return The tag now active
     */
    Result<std::string> use(const std::string& app_name,
                            const std::optional<std::string>& tag = std::nullopt,
                            bool force = false);

    /// Remove the launch entry and clear the active tag
    Result<void> unlink(const std::string& app_name, bool force = false);

    /// Stop tracking app_name@tag; its managed copy is deleted
    Result<void> untrack(const std::string& app_name, const std::string& tag);

    Result<void> rename_tag(const std::string& app_name, const std::string& tag,
                            const std::string& new_tag);

    Result<void> describe(const std::string& app_name, const std::string& tag,
                          const std::optional<std::string>& description);

    Result<std::vector<ListRow>> list(const std::optional<std::string>& app_name = std::nullopt,
                                      bool all = false) const;

    Result<std::string> current(const std::string& app_name) const;

    /// Run the active command of app_name; returns its exit status
    Result<int> run(const std::string& app_name, const std::vector<std::string>& args) const;

    /// Load the registry without modifying anything
    Result<Registry> registry() const;

private:
    // Save the mutated registry, then move staged copies into place and drop
    // stale files. On a failed save the launch entry of app_name is restored
    // and staged copies are deleted.
    Result<void> commit(const std::string& app_name, const Mutation& mutation,
                        const InstalledEntry& before);

    Layout layout_;
    RegistryStore& store_;
};

} // namespace altb
