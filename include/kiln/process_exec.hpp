#pragma once

#include "kiln/utility.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiln {

struct ProcessOptions {
    std::optional<std::string> working_dir;
    /// Extends/overrides the parent environment.
    std::optional<std::unordered_map<std::string, std::string>> env;
    /// Zero means no deadline.
    std::chrono::milliseconds deadline{0};
};

/**
 * @brief Executes a subprocess and waits for it.
 *
 * stdout and stderr go to the parent's. Past the deadline the child is sent
 * SIGTERM, then SIGKILL.
 *
 * @param args The command line arguments (first argument is the executable).
 * @return The exit code, or an error if the process could not run or timed out.
 */
Result<int> process_exec(std::vector<std::string> args, const ProcessOptions &opts = {});

} // namespace kiln
