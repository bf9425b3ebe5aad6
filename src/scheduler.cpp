#include "kiln/scheduler.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <numeric>
#include <string>

namespace kiln {

namespace {

// Calibrated offline on 40, 400 and 4000 page sites.
// Order: break_even, optimal_small, optimal_large, large_workload, contention_point.
constexpr PhaseProfile PROFILES[3][PHASE_COUNT] = {
    // Ci: 2-4 vCPU runners
    {
        {32, 2, 4, 1000, 4},  // Discovery
        {8, 2, 2, 500, 2},    // Parsing
        {8, 2, 2, 500, 2},    // Rendering
        {16, 2, 2, 500, 2},   // PostProcessing
    },
    // Local: 8-16 core workstations
    {
        {32, 4, 8, 1000, 12}, // Discovery
        {8, 4, 8, 500, 8},    // Parsing
        {8, 4, 8, 500, 10},   // Rendering
        {16, 2, 4, 500, 6},   // PostProcessing
    },
    // Production: 16+ cores
    {
        {32, 4, 12, 1000, 16}, // Discovery
        {8, 4, 12, 500, 16},   // Parsing
        {8, 4, 12, 500, 16},   // Rendering
        {16, 2, 6, 500, 8},    // PostProcessing
    },
};

constexpr std::string_view CI_VARIABLES[] = {
    "CI",
    "GITHUB_ACTIONS",
    "GITLAB_CI",
    "CIRCLECI",
    "TRAVIS",
    "JENKINS_URL",
    "BUILDKITE",
    "CODEBUILD_BUILD_ID",
    "TF_BUILD",
};

bool env_set(std::string_view name) {
    const char *v = std::getenv(std::string(name).c_str());
    return v != nullptr && *v != '\0';
}

} // namespace

std::string_view to_string(Phase phase) {
    switch (phase) {
    case Phase::Discovery:
        return "discovery";
    case Phase::Parsing:
        return "parsing";
    case Phase::Rendering:
        return "rendering";
    case Phase::PostProcessing:
        return "postprocessing";
    }
    return "unknown";
}

std::string_view to_string(Environment env) {
    switch (env) {
    case Environment::Ci:
        return "ci";
    case Environment::Local:
        return "local";
    case Environment::Production:
        return "production";
    }
    return "unknown";
}

std::optional<Phase> parse_phase(std::string_view name) {
    for (Phase p : {Phase::Discovery, Phase::Parsing, Phase::Rendering, Phase::PostProcessing}) {
        if (to_string(p) == name)
            return p;
    }
    return std::nullopt;
}

std::optional<Environment> parse_environment(std::string_view name) {
    for (Environment e : {Environment::Ci, Environment::Local, Environment::Production}) {
        if (to_string(e) == name)
            return e;
    }
    return std::nullopt;
}

Environment detect_environment() {
    if (const char *explicit_env = std::getenv("KILN_ENV")) {
        std::string value(explicit_env);
        std::ranges::transform(value, value.begin(), [](unsigned char c) { return std::tolower(c); });
        if (auto env = parse_environment(value))
            return *env;
    }
    for (auto var : CI_VARIABLES) {
        if (env_set(var))
            return Environment::Ci;
    }
    return Environment::Local;
}

PhaseProfile calibrated_profile(Phase phase, Environment env) {
    return PROFILES[static_cast<size_t>(env)][static_cast<size_t>(phase)];
}

Scheduler::Scheduler() : Scheduler(Options{}) {
}

Scheduler::Scheduler(Options options)
    : env_(options.environment.value_or(detect_environment())), parallel_(options.parallel),
      max_workers_(options.max_workers) {
    for (size_t i = 0; i < PHASE_COUNT; ++i) {
        auto phase = static_cast<Phase>(i);
        if (auto it = options.overrides.find(phase); it != options.overrides.end())
            profiles_[i] = it->second;
        else
            profiles_[i] = calibrated_profile(phase, env_);
    }
}

ScheduleDecision Scheduler::choose(Phase phase, size_t task_count) const {
    const PhaseProfile &p = profile(phase);
    if (!parallel_ || task_count == 0 || task_count < p.break_even)
        return {1, false};

    size_t optimal = task_count < p.large_workload ? p.optimal_small : p.optimal_large;
    if (max_workers_ > 0)
        optimal = max_workers_;

    size_t workers = std::min(optimal, p.contention_point);
    workers = std::clamp<size_t>(workers, 1, task_count);
    return {workers, workers > 1};
}

double task_weight(uint64_t bytes) {
    constexpr double THRESHOLD = 10000.0;
    double weight = 1.0;
    if (static_cast<double>(bytes) > THRESHOLD)
        weight += (static_cast<double>(bytes) - THRESHOLD) / 20000.0;
    return std::min(weight, 5.0);
}

std::vector<size_t> order_by_weight(const std::vector<double> &weights) {
    std::vector<size_t> order(weights.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::ranges::stable_sort(order, [&](size_t a, size_t b) { return weights[a] > weights[b]; });
    return order;
}

} // namespace kiln
