/**
 * altb CLI - untrack command
 *
 * Forget a tag. Removing the active tag also removes the launch entry.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace altb::cli::commands {

namespace {

struct UntrackOptions {
    std::string target;  // app@tag
};

int cmd_untrack(const GlobalOptions& opts, const UntrackOptions& untrack_opts) {
    auto ref = parse_tagged_ref(untrack_opts.target, opts.json);
    if (!ref) return 1;

    auto ctx = open_context(opts);
    if (!ctx) return 1;

    auto removed = ctx->switcher->untrack(ref->name, *ref->tag);
    if (removed.isErr()) {
        print_error(removed.error(), opts.json);
        return 1;
    }

    print_success("Untracked " + ref->name + "@" + *ref->tag, opts);
    return 0;
}

} // anonymous namespace

void setup_untrack(CLI::App* app, GlobalOptions& opts) {
    static UntrackOptions untrack_opts;

    app->add_option("app", untrack_opts.target, "Tag to remove - <app_name>@<tag_name>")
        ->required();

    app->callback([&opts]() {
        std::exit(cmd_untrack(opts, untrack_opts));
    });
}

} // namespace altb::cli::commands
