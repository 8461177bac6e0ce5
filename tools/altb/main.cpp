/**
 * altb CLI - Entry Point
 *
 * Track alternative versions of a command and switch between them.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace altb::cli::commands {
    void setup_track(CLI::App* app, GlobalOptions& opts);
    void setup_use(CLI::App* app, GlobalOptions& opts);
    void setup_unlink(CLI::App* app, GlobalOptions& opts);
    void setup_untrack(CLI::App* app, GlobalOptions& opts);
    void setup_rename(CLI::App* app, GlobalOptions& opts);
    void setup_describe(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_run(CLI::App* app, GlobalOptions& opts);
    void setup_config(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace altb::cli;

    CLI::App app{"altb - alternatives binary switcher"};
    app.set_version_flag("-V,--version", ALTB_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Registry file (default ~/.config/altb/config.json)");
    app.add_option("--bin-dir", opts.bin_dir, "Directory holding launch entries");
    app.add_option("--data-dir", opts.data_dir, "Directory holding managed copies");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* track_cmd = app.add_subcommand("track", "Track a new binary or command");
    commands::setup_track(track_cmd, opts);

    auto* use_cmd = app.add_subcommand("use", "Switch an application to a tag");
    commands::setup_use(use_cmd, opts);

    auto* unlink_cmd = app.add_subcommand("unlink", "Remove the launch entry of an application");
    commands::setup_unlink(unlink_cmd, opts);

    auto* untrack_cmd = app.add_subcommand("untrack", "Stop tracking a tag");
    commands::setup_untrack(untrack_cmd, opts);

    auto* rename_cmd = app.add_subcommand("rename", "Rename a tag");
    commands::setup_rename(rename_cmd, opts);

    auto* describe_cmd = app.add_subcommand("describe", "Set or clear the description of a tag");
    commands::setup_describe(describe_cmd, opts);

    auto* list_cmd = app.add_subcommand("list", "List tracked applications");
    commands::setup_list(list_cmd, opts);

    auto* run_cmd = app.add_subcommand("run", "Run the active command of an application");
    commands::setup_run(run_cmd, opts);

    auto* config_cmd = app.add_subcommand("config", "Print resolved locations and the registry");
    commands::setup_config(config_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
