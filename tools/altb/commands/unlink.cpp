/**
 * altb CLI - unlink command
 *
 * Remove the launch entry of an application and clear its active tag.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace altb::cli::commands {

namespace {

struct UnlinkOptions {
    std::string app;
    bool force = false;
};

int cmd_unlink(const GlobalOptions& opts, const UnlinkOptions& unlink_opts) {
    auto ref = parse_ref(unlink_opts.app, opts.json);
    if (!ref) return 1;

    auto ctx = open_context(opts);
    if (!ctx) return 1;

    auto unlinked = ctx->switcher->unlink(ref->name, unlink_opts.force);
    if (unlinked.isErr()) {
        print_error(unlinked.error(), opts.json);
        return 1;
    }

    print_success("Unlinked " + ref->name, opts);
    return 0;
}

} // anonymous namespace

void setup_unlink(CLI::App* app, GlobalOptions& opts) {
    static UnlinkOptions unlink_opts;

    app->add_option("app", unlink_opts.app, "Application name")->required();
    app->add_flag("-f,--force", unlink_opts.force,
                  "Remove the launch entry even if it was not created by altb");

    app->callback([&opts]() {
        std::exit(cmd_unlink(opts, unlink_opts));
    });
}

} // namespace altb::cli::commands
