/**
 * altb CLI - rename command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace altb::cli::commands {

namespace {

struct RenameOptions {
    std::string target;  // app@tag
    std::string new_tag;
};

int cmd_rename(const GlobalOptions& opts, const RenameOptions& rename_opts) {
    auto ref = parse_tagged_ref(rename_opts.target, opts.json);
    if (!ref) return 1;

    auto ctx = open_context(opts);
    if (!ctx) return 1;

    auto renamed = ctx->switcher->rename_tag(ref->name, *ref->tag, rename_opts.new_tag);
    if (renamed.isErr()) {
        print_error(renamed.error(), opts.json);
        return 1;
    }

    print_success("Renamed " + ref->name + "@" + *ref->tag + " to " +
                  ref->name + "@" + rename_opts.new_tag, opts);
    return 0;
}

} // anonymous namespace

void setup_rename(CLI::App* app, GlobalOptions& opts) {
    static RenameOptions rename_opts;

    app->add_option("app", rename_opts.target, "Tag to rename - <app_name>@<tag_name>")
        ->required();
    app->add_option("new_tag", rename_opts.new_tag, "New tag name")->required();

    app->callback([&opts]() {
        std::exit(cmd_rename(opts, rename_opts));
    });
}

} // namespace altb::cli::commands
