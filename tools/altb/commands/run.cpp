/**
 * altb CLI - run command
 *
 * Run the active command entry of an application in the foreground.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace altb::cli::commands {

namespace {

struct RunOptions {
    std::string app;
    std::vector<std::string> args;
};

int cmd_run(const GlobalOptions& opts, const RunOptions& run_opts) {
    auto ctx = open_context(opts);
    if (!ctx) return 1;

    auto status = ctx->switcher->run(run_opts.app, run_opts.args);
    if (status.isErr()) {
        print_error(status.error(), opts.json);
        return 1;
    }
    return status.value();
}

} // anonymous namespace

void setup_run(CLI::App* app, GlobalOptions& opts) {
    static RunOptions run_opts;

    app->add_option("app", run_opts.app, "Application name")->required();
    app->add_option("args", run_opts.args, "Arguments passed to the command (after --)");

    app->callback([&opts]() {
        std::exit(cmd_run(opts, run_opts));
    });
}

} // namespace altb::cli::commands
