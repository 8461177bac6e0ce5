/**
 * altb CLI - list command
 *
 * List tracked applications and their tags.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace altb::cli::commands {

namespace {

struct ListOptions {
    std::string app;
    bool all = false;
    bool is_short = false;
    bool current_only = false;
};

nlohmann::json row_to_json(const altb::ListRow& row) {
    nlohmann::json j;
    j["app"] = row.app_name;
    j["tag"] = row.tag;
    j["kind"] = altb::entry_kind_to_string(row.kind);
    j["target"] = row.target_summary;
    j["active"] = row.is_active;
    if (row.description) {
        j["description"] = *row.description;
    }
    return j;
}

int cmd_current(const GlobalOptions& opts, const Context& ctx, const std::string& app_name) {
    auto tag = ctx.switcher->current(app_name);
    if (tag.isErr()) {
        print_error(tag.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["app"] = app_name;
        j["tag"] = tag.value();
        output_json(j);
    } else {
        std::cout << tag.value() << std::endl;
    }
    return 0;
}

int cmd_list(const GlobalOptions& opts, const ListOptions& list_opts) {
    auto ctx = open_context(opts);
    if (!ctx) return 1;

    auto app_name = non_empty(list_opts.app);
    if (app_name && list_opts.current_only) {
        return cmd_current(opts, *ctx, *app_name);
    }

    auto rows = ctx->switcher->list(app_name, list_opts.all);
    if (rows.isErr()) {
        print_error(rows.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json result = nlohmann::json::array();
        for (const auto& row : rows.value()) {
            result.push_back(row_to_json(row));
        }
        output_json(result);
        return 0;
    }

    if (rows.value().empty()) {
        if (!app_name) {
            std::cerr << "No binaries currently tracked, use \"altb track\" to start" << std::endl;
        }
        return 0;
    }

    // Rows arrive grouped by application
    std::string last_app;
    for (const auto& row : rows.value()) {
        if (row.app_name != last_app) {
            std::cout << row.app_name << std::endl;
            last_app = row.app_name;
        }
        std::cout << (row.is_active ? "  * " : "    ") << row.tag;
        if (!list_opts.is_short) {
            std::cout << " - " << row.target_summary;
        }
        std::cout << std::endl;
        if (row.description && !list_opts.is_short) {
            std::cout << "      " << *row.description << std::endl;
        }
    }
    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    static ListOptions list_opts;

    app->add_option("app", list_opts.app, "Application name");
    app->add_flag("-a,--all", list_opts.all, "Print all tags");
    app->add_flag("-1,-s,--short", list_opts.is_short, "Print short version");
    app->add_flag("-t,--current-tag", list_opts.current_only, "Print current tag only");

    app->callback([&opts]() {
        std::exit(cmd_list(opts, list_opts));
    });
}

} // namespace altb::cli::commands
