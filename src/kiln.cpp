#include "kiln/config.hpp"
#include "kiln/log.hpp"
#include "kiln/orchestrator.hpp"
#include "kiln/process_renderer.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <print>
#include <set>
#include <stop_token>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t interrupted = 0;

void on_sigint(int) {
    interrupted = 1;
}

void print_help() {
    std::println("Usage: kiln [options]");
    std::println("Options:");
    std::println("  -h, --help           Show this help message");
    std::println("  -v, --version        Show version");
    std::println("  -d <dir>             Change working directory before doing anything");
    std::println("  -f <file>            Use <file> as the site config (default: kiln.json)");
    std::println("  -j, --jobs <N>       Cap worker count per phase (default: calibrated)");
    std::println("  --full               Ignore the cache and rebuild everything");
    std::println("  --sequential         Run every phase on one thread");
    std::println("  --fast               Only print warnings and errors");
    std::println("  --memory-optimized   Write outputs from workers instead of buffering them");
    std::println("  --dry-run            Print what would be rebuilt and why");
    std::println("  --graph              Generate DOT graph of recorded dependencies");
    std::println("  --clean              Remove build outputs and the cache");
    std::println("  --verbose            Print state transitions and scheduling decisions");
}

void print_version() {
    std::println("kiln {}", KILN_PROJ_VER);
}

} // namespace

int main(const int argc, const char *const *argv) {
    bool full = false;
    bool sequential = false;
    bool fast = false;
    bool memory_optimized = false;
    bool dry_run = false;
    bool graph = false;
    bool clean = false;
    bool verbose = false;
    size_t jobs = 0;
    std::string config_path = "kiln.json";
    std::filesystem::path work_dir = ".";

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "-d") {
            if (i + 1 < argc) {
                work_dir = argv[i + 1];
                i++;
            } else {
                std::println(std::cerr, "Missing argument for -d");
                return 1;
            }
        } else if (arg == "-f") {
            if (i + 1 < argc) {
                config_path = argv[i + 1];
                i++;
            } else {
                std::println(std::cerr, "Missing argument for -f");
                return 1;
            }
        } else if (arg == "--full") {
            full = true;
        } else if (arg == "--sequential") {
            sequential = true;
        } else if (arg == "--fast") {
            fast = true;
        } else if (arg == "--memory-optimized") {
            memory_optimized = true;
        } else if (arg == "--dry-run") {
            dry_run = true;
        } else if (arg == "--graph") {
            graph = true;
        } else if (arg == "--clean") {
            clean = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "-j" || arg == "--jobs") {
            if (i + 1 < argc) {
                auto res = std::from_chars(argv[i + 1], argv[i + 1] + strlen(argv[i + 1]), jobs);
                if (res.ec == std::errc() && jobs > 0) {
                    i++;
                } else {
                    std::println(std::cerr, "Invalid job count: {}", argv[i + 1]);
                    return 1;
                }
            } else {
                std::println(std::cerr, "Missing argument for {}", arg);
                return 1;
            }
        } else {
            std::println(std::cerr, "Unknown argument: {}", arg);
            print_help();
            return 1;
        }
    }

    if (work_dir != ".") {
        std::error_code ec;
        std::filesystem::current_path(work_dir, ec);
        if (ec) {
            std::println(std::cerr, "Failed to change directory to {}: {}", work_dir.string(), ec.message());
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path)) {
        std::println(std::cerr, "Config File: {} does not exist.", config_path);
        return 1;
    }

    auto loaded = kiln::load_config(config_path);
    if (!loaded) {
        std::println(std::cerr, "ConfigError: {}", loaded.error());
        return 1;
    }
    kiln::EngineConfig config = std::move(*loaded);
    if (sequential)
        config.parallel = false;
    if (jobs > 0)
        config.max_workers = jobs;
    if (memory_optimized)
        config.memory_optimized = true;
    if (fast)
        config.fast = true;

    if (verbose)
        kiln::set_log_level(kiln::LogLevel::Debug);
    else if (config.fast)
        kiln::set_log_level(kiln::LogLevel::Warn);

    bool renders = !clean && !dry_run && !graph;
    if (renders && config.render.command.empty()) {
        std::println(std::cerr, "ConfigError: render.command is not set in {}", config_path);
        return 1;
    }

    kiln::ProcessRenderer renderer({config.render.command, config.render.timeout, config.scratch_dir()});
    kiln::BuildOrchestrator orchestrator{std::move(config), renderer};
    auto mode = full ? kiln::BuildMode::Full : kiln::BuildMode::Incremental;

    if (clean) {
        auto res = orchestrator.clean();
        if (!res) {
            std::println(std::cerr, "Clean failed: {}", kiln::describe(res.error()));
            return 1;
        }
        kiln::log_info("Removed {} output(s)", *res);
        return 0;
    }

    if (dry_run || graph) {
        auto plan = orchestrator.plan(mode);
        if (!plan)
            return 1;
        if (graph) {
            std::set<std::string> dirty;
            for (const auto &[id, _] : plan->dirty)
                dirty.insert(id);
            orchestrator.graph().emit_dot(std::cout, dirty);
            return 0;
        }
        for (const auto &[id, reason] : plan->dirty)
            std::println("[DRY RUN] {} -> {}", kiln::to_string(reason), id);
        for (const auto &id : plan->removed)
            std::println("[DRY RUN] removed -> {}", id);
        std::println("{} of {} output(s) would be rebuilt", plan->dirty.size(), plan->total_outputs);
        return 0;
    }

    std::signal(SIGINT, on_sigint);
    std::stop_source stop;
    std::jthread watcher([&stop](std::stop_token self) {
        while (!self.stop_requested()) {
            if (interrupted) {
                stop.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    auto summary = orchestrator.run_cycle(mode, stop.get_token());
    watcher.request_stop();
    if (!summary) {
        std::println(std::cerr, "Build failed: {}", kiln::describe(summary.error()));
        return summary.error().kind == kiln::ErrorKind::Cancelled ? 130 : 1;
    }

    kiln::log_info("Rebuilt {}, reused {}, removed {}, failed {} in {} ms ({} pass(es), {} fragment hit(s))",
                   summary->rebuilt,
                   summary->reused,
                   summary->removed,
                   summary->failed(),
                   summary->elapsed.count(),
                   summary->passes,
                   summary->fragment_hits);
    if (summary->failed() > 0) {
        for (const auto &err : summary->failures)
            std::println(std::cerr, "  {}", kiln::describe(err));
        std::println(std::cerr, "{} artifact(s) failed", summary->failed());
    }
    return summary->exit_code();
}
