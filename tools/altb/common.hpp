/**
 * altb CLI - Common utilities and types
 */

#pragma once

#include <altb/registry_store.hpp>
#include <altb/settings.hpp>
#include <altb/switcher.hpp>
#include <altb/tag_resolver.hpp>
#include <altb/types.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace altb::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    std::string bin_dir;           // --bin-dir
    std::string data_dir;          // --data-dir
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

inline std::optional<std::string> non_empty(const std::string& value) {
    return value.empty() ? std::nullopt : std::make_optional(value);
}

/**
 * Configure spdlog from the verbosity flags.
 */
inline void init_logging(const GlobalOptions& opts) {
    if (opts.quiet) {
        spdlog::set_level(spdlog::level::off);
    } else if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
    spdlog::set_pattern("[%^%l%$] %v");
}

/**
 * Output utilities.
 */
inline void print_error(const altb::Error& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["code"] = altb::error_code_to_string(error.code());
        j["error"] = error.message();
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << error.message() << std::endl;
    }
}

inline void print_success(const std::string& msg, const GlobalOptions& opts) {
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["message"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else if (!opts.quiet) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

/**
 * Everything a command needs: resolved settings, the store and the switcher.
 */
struct Context {
    altb::Settings settings;
    std::unique_ptr<altb::FileRegistryStore> store;
    std::unique_ptr<altb::Switcher> switcher;
};

/**
 * Resolve settings from flags/environment and open the registry.
 * Prints the error and returns nullopt on failure.
 */
inline std::optional<Context> open_context(const GlobalOptions& opts) {
    init_logging(opts);

    altb::SettingsOverrides overrides;
    overrides.config_path = non_empty(opts.config);
    overrides.bin_dir = non_empty(opts.bin_dir);
    overrides.data_dir = non_empty(opts.data_dir);

    auto settings = altb::resolve_settings(overrides);
    if (settings.isErr()) {
        print_error(settings.error(), opts.json);
        return std::nullopt;
    }

    Context ctx;
    ctx.settings = settings.value();
    ctx.store = std::make_unique<altb::FileRegistryStore>(ctx.settings.config_path,
                                                          ctx.settings.versions_dir(),
                                                          ctx.settings.legacy_config_path);
    ctx.switcher = std::make_unique<altb::Switcher>(ctx.settings.layout(), *ctx.store);
    spdlog::debug("registry: {}", ctx.settings.config_path);
    spdlog::debug("bin dir: {}", ctx.settings.bin_dir);
    return ctx;
}

/**
 * Parse "app" or "app@tag"; prints the error on failure.
 */
inline std::optional<altb::AppRef> parse_ref(const std::string& ref, bool json_mode) {
    auto parsed = altb::parse_app_ref(ref);
    if (parsed.isErr()) {
        print_error(parsed.error(), json_mode);
        return std::nullopt;
    }
    return parsed.value();
}

/**
 * Parse "app@tag" where the tag is mandatory.
 */
inline std::optional<altb::AppRef> parse_tagged_ref(const std::string& ref, bool json_mode) {
    auto parsed = parse_ref(ref, json_mode);
    if (parsed && !parsed->tag) {
        print_error(altb::Error(altb::ErrorCode::MISSING_TAG,
                                "tag not specified for application " + parsed->name +
                                " (expected " + parsed->name + "@<tag>)"),
                    json_mode);
        return std::nullopt;
    }
    return parsed;
}

} // namespace altb::cli
