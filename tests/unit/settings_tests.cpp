#include <doctest/doctest.h>
#include <altb/settings.hpp>

#include <cstdlib>
#include <optional>
#include <string>

using namespace altb;

namespace {

// Set environment variables for the scope of a test, restoring them afterwards
class ScopedEnv {
public:
    ScopedEnv(const char* name, const std::optional<std::string>& value) : name_(name) {
        if (const char* old = std::getenv(name)) previous_ = std::string(old);
        if (value) {
            setenv(name, value->c_str(), 1);
        } else {
            unsetenv(name);
        }
    }

    ~ScopedEnv() {
        if (previous_) {
            setenv(name_, previous_->c_str(), 1);
        } else {
            unsetenv(name_);
        }
    }

private:
    const char* name_;
    std::optional<std::string> previous_;
};

} // namespace

TEST_CASE("layout helpers name managed copies and launch entries") {
    Layout layout;
    layout.bin_dir = "/home/u/.local/bin";
    layout.versions_dir = "/home/u/.local/share/altb/versions";

    CHECK(managed_app_directory(layout, "helm") == "/home/u/.local/share/altb/versions/helm");
    CHECK(managed_copy_path_for(layout, "helm", "3") ==
          "/home/u/.local/share/altb/versions/helm/helm_3");
    CHECK(launch_entry_path(layout, "helm") == "/home/u/.local/bin/helm");
}

TEST_CASE("settings default under the home directory") {
    ScopedEnv home("ALTB_HOME_PATH", std::string("/tmp/altb-home"));
    ScopedEnv config("ALTB_CONFIG_PATH", std::nullopt);
    ScopedEnv bin("ALTB_BIN_PATH", std::nullopt);
    ScopedEnv data("ALTB_DATA_PATH", std::nullopt);

    auto settings = resolve_settings();
    REQUIRE(settings.isOk());
    CHECK(settings.value().home_dir == "/tmp/altb-home");
    CHECK(settings.value().config_path == "/tmp/altb-home/.config/altb/config.json");
    CHECK(settings.value().legacy_config_path == "/tmp/altb-home/.config/altb/config.yaml");
    CHECK(settings.value().bin_dir == "/tmp/altb-home/.local/bin");
    CHECK(settings.value().data_dir == "/tmp/altb-home/.local/share/altb");
    CHECK(settings.value().versions_dir() == "/tmp/altb-home/.local/share/altb/versions");

    Layout layout = settings.value().layout();
    CHECK(layout.bin_dir == settings.value().bin_dir);
    CHECK(layout.versions_dir == settings.value().versions_dir());
    CHECK(layout.home_dir == "/tmp/altb-home");
}

TEST_CASE("environment variables override defaults") {
    ScopedEnv home("ALTB_HOME_PATH", std::string("/tmp/altb-home"));
    ScopedEnv config("ALTB_CONFIG_PATH", std::string("~/altb.json"));
    ScopedEnv bin("ALTB_BIN_PATH", std::string("/tmp/altb-bin"));
    ScopedEnv data("ALTB_DATA_PATH", std::nullopt);

    auto settings = resolve_settings();
    REQUIRE(settings.isOk());
    CHECK(settings.value().config_path == "/tmp/altb-home/altb.json");
    CHECK(settings.value().legacy_config_path.empty());
    CHECK(settings.value().bin_dir == "/tmp/altb-bin");
}

TEST_CASE("explicit overrides win over the environment") {
    ScopedEnv home("ALTB_HOME_PATH", std::string("/tmp/altb-home"));
    ScopedEnv bin("ALTB_BIN_PATH", std::string("/tmp/altb-bin"));

    SettingsOverrides overrides;
    overrides.bin_dir = "/tmp/flag-bin";
    overrides.data_dir = "/tmp/flag-data";

    auto settings = resolve_settings(overrides);
    REQUIRE(settings.isOk());
    CHECK(settings.value().bin_dir == "/tmp/flag-bin");
    CHECK(settings.value().versions_dir() == "/tmp/flag-data/versions");
}

TEST_CASE("settings without any home fail") {
    ScopedEnv altb_home("ALTB_HOME_PATH", std::nullopt);
    ScopedEnv home("HOME", std::nullopt);
    ScopedEnv config("ALTB_CONFIG_PATH", std::nullopt);

    auto settings = resolve_settings();
    REQUIRE(settings.isErr());
    CHECK(settings.error().code() == ErrorCode::IO_ERROR);
}
