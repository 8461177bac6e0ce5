/**
 * altb CLI - track command
 *
 * Register a file or a shell command under an application tag.
 */

#include "../common.hpp"
#include <altb/platform.hpp>
#include <CLI/CLI.hpp>

namespace altb::cli::commands {

namespace {

struct TrackPathOptions {
    std::string target;            // app[@tag]
    std::string path;
    std::string description;
    bool copy = false;
};

struct TrackCommandOptions {
    std::string target;            // app@tag
    std::string command;
    std::string working_directory;
    std::vector<std::string> env;  // KEY=VALUE
    std::string description;
};

int cmd_track_path(const GlobalOptions& opts, const TrackPathOptions& track_opts) {
    auto ref = parse_ref(track_opts.target, opts.json);
    if (!ref) return 1;

    auto ctx = open_context(opts);
    if (!ctx) return 1;

    auto tracked = ctx->switcher->track_path(ref->name, ref->tag, track_opts.path, track_opts.copy,
                                             non_empty(track_opts.description));
    if (tracked.isErr()) {
        print_error(tracked.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["app"] = ref->name;
        j["tag"] = tracked.value();
        output_json(j);
    } else {
        print_success("Tracked " + ref->name + "@" + tracked.value(), opts);
    }
    return 0;
}

int cmd_track_command(const GlobalOptions& opts, const TrackCommandOptions& track_opts) {
    auto ref = parse_tagged_ref(track_opts.target, opts.json);
    if (!ref) return 1;

    altb::EnvMap environment;
    for (const auto& assignment : track_opts.env) {
        auto eq = assignment.find('=');
        if (eq == std::string::npos || eq == 0) {
            print_error(altb::Error(altb::ErrorCode::INVALID_NAME,
                                    "environment must be given as KEY=VALUE: " + assignment),
                        opts.json);
            return 1;
        }
        environment[assignment.substr(0, eq)] = assignment.substr(eq + 1);
    }

    auto ctx = open_context(opts);
    if (!ctx) return 1;

    std::optional<std::string> working_directory;
    if (!track_opts.working_directory.empty()) {
        working_directory = altb::make_absolute(
            altb::expand_user(track_opts.working_directory, ctx->settings.home_dir));
    }

    auto tracked = ctx->switcher->track_command(ref->name, ref->tag, track_opts.command,
                                                working_directory, environment,
                                                non_empty(track_opts.description));
    if (tracked.isErr()) {
        print_error(tracked.error(), opts.json);
        return 1;
    }

    print_success("Tracked " + ref->name + "@" + *ref->tag, opts);
    return 0;
}

} // anonymous namespace

void setup_track(CLI::App* app, GlobalOptions& opts) {
    static TrackPathOptions path_opts;
    static TrackCommandOptions command_opts;

    app->require_subcommand(1);

    auto* path_cmd = app->add_subcommand("path", "Add new tracking of path kind");
    path_cmd->add_option("app", path_opts.target, "Application name - <app_name>[@<tag_name>]")
        ->required();
    path_cmd->add_option("path", path_opts.path, "Binary actual path")->required();
    path_cmd->add_flag("-c,--copy", path_opts.copy,
                       "Copy file to the versions directory (mainly for binaries)");
    path_cmd->add_option("-d,--description", path_opts.description,
                         "Description of the tracked file");
    path_cmd->callback([&opts]() {
        std::exit(cmd_track_path(opts, path_opts));
    });

    auto* command_cmd = app->add_subcommand("command", "Add new tracking of command kind");
    command_cmd->add_option("app", command_opts.target, "Application name - <app_name>@<tag_name>")
        ->required();
    command_cmd->add_option("command", command_opts.command, "Command to run")->required();
    command_cmd->add_option("-w,--working-directory", command_opts.working_directory,
                            "Working directory of the running command");
    command_cmd->add_option("-e,--env", command_opts.env,
                            "Environment variable for the command (KEY=VALUE, repeatable)");
    command_cmd->add_option("-d,--description", command_opts.description,
                            "Description of the tracked command");
    command_cmd->callback([&opts]() {
        std::exit(cmd_track_command(opts, command_opts));
    });
}

} // namespace altb::cli::commands
