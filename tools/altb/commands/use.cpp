/**
 * altb CLI - use command
 *
 * Point the launch entry of an application at one of its tags.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace altb::cli::commands {

namespace {

struct UseOptions {
    std::string target;  // app[@tag]
    bool force = false;
};

int cmd_use(const GlobalOptions& opts, const UseOptions& use_opts) {
    auto ref = parse_ref(use_opts.target, opts.json);
    if (!ref) return 1;

    auto ctx = open_context(opts);
    if (!ctx) return 1;

    auto used = ctx->switcher->use(ref->name, ref->tag, use_opts.force);
    if (used.isErr()) {
        print_error(used.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["app"] = ref->name;
        j["tag"] = used.value();
        j["launch_entry"] = altb::launch_entry_path(ctx->settings.layout(), ref->name);
        output_json(j);
    } else {
        print_success("Using " + ref->name + "@" + used.value(), opts);
    }
    return 0;
}

} // anonymous namespace

void setup_use(CLI::App* app, GlobalOptions& opts) {
    static UseOptions use_opts;

    app->add_option("app", use_opts.target,
                    "Application to use - <app_name>[@<tag_name>], the active tag if omitted")
        ->required();
    app->add_flag("-f,--force", use_opts.force,
                  "Replace a launch entry that was not created by altb");

    app->callback([&opts]() {
        std::exit(cmd_use(opts, use_opts));
    });
}

} // namespace altb::cli::commands
