#pragma once

#include "altb/entry.hpp"
#include "altb/registry.hpp"
#include "altb/types.hpp"

#include <string>
#include <vector>

namespace altb {

/// argv for running a command entry through /bin/sh with forwarded arguments
std::vector<std::string> build_command_argv(const std::string& app_name,
                                            const CommandEntry& command,
                                            const std::vector<std::string>& args);

/// Inherited environment with the entry's variables layered on top ("KEY=VALUE")
std::vector<std::string> build_command_environment(const CommandEntry& command);

/**
 * Run the active tag of a command application and wait for it.
 * Returns the child's exit status (128 + signal number if it was killed).
 * Fails with UNKNOWN_APPLICATION, NO_ACTIVE_TAG, NOT_RUNNABLE (active entry
 * is a path entry), TARGET_MISSING (working directory is gone) or IO_ERROR.
 */
Result<int> run(const Registry& registry, const std::string& app_name,
                const std::vector<std::string>& args);

} // namespace altb
