/**
 * altb CLI - config command
 *
 * Show where altb keeps its state and print the registry document.
 */

#include "../common.hpp"
#include <altb/registry.hpp>
#include <CLI/CLI.hpp>

namespace altb::cli::commands {

namespace {

int cmd_config(const GlobalOptions& opts) {
    auto ctx = open_context(opts);
    if (!ctx) return 1;

    auto registry = ctx->switcher->registry();
    if (registry.isErr()) {
        print_error(registry.error(), opts.json);
        return 1;
    }

    std::string document = altb::serialize_registry(registry.value());

    if (opts.json) {
        nlohmann::json j;
        j["config_path"] = ctx->settings.config_path;
        if (!ctx->settings.legacy_config_path.empty()) {
            j["legacy_config_path"] = ctx->settings.legacy_config_path;
        }
        j["bin_dir"] = ctx->settings.bin_dir;
        j["data_dir"] = ctx->settings.data_dir;
        j["versions_dir"] = ctx->settings.versions_dir();
        j["registry"] = nlohmann::json::parse(document);
        output_json(j);
        return 0;
    }

    if (!opts.quiet) {
        std::cout << "# config:   " << ctx->settings.config_path << std::endl;
        std::cout << "# bin dir:  " << ctx->settings.bin_dir << std::endl;
        std::cout << "# versions: " << ctx->settings.versions_dir() << std::endl;
    }
    std::cout << document;
    return 0;
}

} // anonymous namespace

void setup_config(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_config(opts));
    });
}

} // namespace altb::cli::commands
