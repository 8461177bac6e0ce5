#include "altb/runner.hpp"
#include "altb/platform.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <sys/wait.h>
#include <unistd.h>

extern "C" char** environ;

namespace altb {

std::vector<std::string> build_command_argv(const std::string& app_name,
                                            const CommandEntry& command,
                                            const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.push_back("/bin/sh");
    argv.push_back("-c");
    argv.push_back(command.command_line + " \"$@\"");
    argv.push_back(app_name);   // $0
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

std::vector<std::string> build_command_environment(const CommandEntry& command) {
    std::vector<std::string> env;

    for (char** ep = environ; ep && *ep; ++ep) {
        std::string entry(*ep);
        auto eq = entry.find('=');
        std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
        if (command.environment.count(key) == 0) {
            env.push_back(entry);
        }
    }

    for (const auto& [key, value] : command.environment) {
        env.push_back(key + "=" + value);
    }
    return env;
}

Result<int> run(const Registry& registry, const std::string& app_name,
                const std::vector<std::string>& args) {
    const Application* app = registry.find(app_name);
    if (!app) {
        return Result<int>::err(Error(ErrorCode::UNKNOWN_APPLICATION,
                                      "app " + app_name + " isn't tracked"));
    }
    if (!app->active_tag) {
        return Result<int>::err(Error(ErrorCode::NO_ACTIVE_TAG,
                                      "app " + app_name + " doesn't have an active tag"));
    }

    const std::string& tag = *app->active_tag;
    const auto* command = std::get_if<CommandEntry>(&app->entries.at(tag).details);
    if (!command) {
        return Result<int>::err(Error(ErrorCode::NOT_RUNNABLE,
            "tag " + tag + " of app " + app_name + " must be of type command to be runnable"));
    }

    std::string cwd;
    if (command->working_directory) {
        cwd = *command->working_directory;
        if (!is_directory(cwd)) {
            return Result<int>::err(Error(ErrorCode::TARGET_MISSING,
                "working directory " + cwd + " doesn't exist for " + app_name + "@" + tag));
        }
    }

    auto argv_strings = build_command_argv(app_name, *command, args);
    auto env_strings = build_command_environment(*command);

    // Build C-style arrays
    std::vector<char*> argv;
    for (auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& s : env_strings) {
        envp.push_back(const_cast<char*>(s.c_str()));
    }
    envp.push_back(nullptr);

    spdlog::debug("running {}@{}: {}", app_name, tag, command->command_line);

    pid_t pid = fork();
    if (pid == -1) {
        return Result<int>::err(Error(ErrorCode::IO_ERROR,
                                      "fork failed: " + std::string(strerror(errno))));
    }

    if (pid == 0) {
        // Child process
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(127);
        }
        execve(argv[0], argv.data(), envp.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return Result<int>::err(Error(ErrorCode::IO_ERROR,
                                          "waitpid failed: " + std::string(strerror(errno))));
        }
    }

    if (WIFEXITED(status)) {
        return Result<int>::ok(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return Result<int>::ok(128 + WTERMSIG(status));
    }
    return Result<int>::ok(1);
}

} // namespace altb
