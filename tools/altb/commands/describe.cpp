/**
 * altb CLI - describe command
 *
 * Set the description of a tag, or clear it when none is given.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace altb::cli::commands {

namespace {

struct DescribeOptions {
    std::string target;  // app@tag
    std::string description;
};

int cmd_describe(const GlobalOptions& opts, const DescribeOptions& describe_opts) {
    auto ref = parse_tagged_ref(describe_opts.target, opts.json);
    if (!ref) return 1;

    auto ctx = open_context(opts);
    if (!ctx) return 1;

    auto described = ctx->switcher->describe(ref->name, *ref->tag,
                                             non_empty(describe_opts.description));
    if (described.isErr()) {
        print_error(described.error(), opts.json);
        return 1;
    }

    if (describe_opts.description.empty()) {
        print_success("Cleared description of " + ref->name + "@" + *ref->tag, opts);
    } else {
        print_success("Described " + ref->name + "@" + *ref->tag, opts);
    }
    return 0;
}

} // anonymous namespace

void setup_describe(CLI::App* app, GlobalOptions& opts) {
    static DescribeOptions describe_opts;

    app->add_option("app", describe_opts.target, "Tag to describe - <app_name>@<tag_name>")
        ->required();
    app->add_option("-d,--description", describe_opts.description,
                    "New description (omit to clear)");

    app->callback([&opts]() {
        std::exit(cmd_describe(opts, describe_opts));
    });
}

} // namespace altb::cli::commands
