#include "kiln/process_exec.hpp"

#include <format>
#include <chrono>
#include <reproc++/run.hpp>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace kiln {

Result<int> process_exec(std::vector<std::string> args, const ProcessOptions &opts) {
    if (args.empty()) {
        return std::unexpected("Cannot execute empty command");
    }

    reproc::options options;
    options.redirect.out.type = reproc::redirect::parent;
    options.redirect.err.type = reproc::redirect::parent;

    if (opts.working_dir) {
        options.working_directory = opts.working_dir->c_str();
    }

    std::vector<std::string> env_strings;
    std::vector<const char *> env_ptrs;
    if (opts.env) {
        options.env.behavior = reproc::env::extend;
        for (const auto &[key, value] : *opts.env) {
            env_strings.push_back(key + "=" + value);
        }
        for (const auto &s : env_strings) {
            env_ptrs.push_back(s.c_str());
        }
        env_ptrs.push_back(nullptr);
        options.env.extra = env_ptrs.data();
    }

    if (opts.deadline.count() > 0) {
        options.deadline = std::chrono::duration_cast<reproc::milliseconds>(opts.deadline);
        options.stop = {
            {reproc::stop::terminate, reproc::milliseconds(2000)},
            {reproc::stop::kill, reproc::milliseconds(1000)},
            {},
        };
    }

    auto start = std::chrono::steady_clock::now();
    auto [status, ec] = reproc::run(args, options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    bool timed_out = ec == std::errc::timed_out || (opts.deadline.count() > 0 && elapsed >= opts.deadline);
    if (timed_out)
        return std::unexpected(std::format("{} timed out after {} ms", args.front(), opts.deadline.count()));
    if (ec)
        return std::unexpected(std::format("Failed to execute {}: {}", args.front(), ec.message()));
    return status;
}

} // namespace kiln
