#include "altb/settings.hpp"
#include "altb/platform.hpp"

namespace altb {

namespace {

constexpr const char* kPackageName = "altb";

std::optional<std::string> non_empty_env(const char* name) {
    auto value = get_env(name);
    if (value && !value->empty()) return value;
    return std::nullopt;
}

// override > env > default(home)
std::optional<std::string> pick(const std::optional<std::string>& override_value,
                                const char* env_name) {
    if (override_value && !override_value->empty()) return override_value;
    return non_empty_env(env_name);
}

} // namespace

std::string managed_app_directory(const Layout& layout, const std::string& app_name) {
    return join_path(layout.versions_dir, app_name);
}

std::string managed_copy_path_for(const Layout& layout, const std::string& app_name,
                                  const std::string& tag) {
    return join_path(managed_app_directory(layout, app_name), app_name + "_" + tag);
}

std::string launch_entry_path(const Layout& layout, const std::string& app_name) {
    return join_path(layout.bin_dir, app_name);
}

Result<Settings> resolve_settings(const SettingsOverrides& overrides) {
    Settings settings;

    auto home = non_empty_env("ALTB_HOME_PATH");
    if (!home) home = non_empty_env("HOME");
    if (home) settings.home_dir = make_absolute(*home);

    auto config_path = pick(overrides.config_path, "ALTB_CONFIG_PATH");
    auto bin_dir = pick(overrides.bin_dir, "ALTB_BIN_PATH");
    auto data_dir = pick(overrides.data_dir, "ALTB_DATA_PATH");

    bool needs_home = !config_path || !bin_dir || !data_dir;
    if (needs_home && settings.home_dir.empty()) {
        return Result<Settings>::err(Error(ErrorCode::IO_ERROR,
            "cannot determine home directory: set HOME or ALTB_HOME_PATH"));
    }

    const std::string& h = settings.home_dir;
    if (config_path) {
        settings.config_path = make_absolute(expand_user(*config_path, h));
    } else {
        settings.config_path = h + "/.config/" + kPackageName + "/config.json";
        settings.legacy_config_path = h + "/.config/" + kPackageName + "/config.yaml";
    }
    settings.bin_dir = bin_dir
        ? make_absolute(expand_user(*bin_dir, h))
        : h + "/.local/bin";
    settings.data_dir = data_dir
        ? make_absolute(expand_user(*data_dir, h))
        : h + "/.local/share/" + kPackageName;

    return Result<Settings>::ok(settings);
}

} // namespace altb
