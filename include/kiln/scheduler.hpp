#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace kiln {

enum class Phase : uint8_t { Discovery, Parsing, Rendering, PostProcessing };

inline constexpr size_t PHASE_COUNT = 4;

enum class Environment : uint8_t { Ci, Local, Production };

/**
 * @brief Calibrated parallelism profile for one phase.
 *
 * Measured offline per phase shape; below `break_even` tasks the pool setup
 * costs more than it saves. `contention_point` is the worker count past which a
 * slowdown of 10% or more was measured.
 */
struct PhaseProfile {
    size_t break_even = 1;
    size_t optimal_small = 1;
    size_t optimal_large = 1;
    size_t large_workload = 1; ///< task count at which `optimal_large` takes over
    size_t contention_point = 1;

    bool operator==(const PhaseProfile &) const = default;
};

struct ScheduleDecision {
    size_t workers = 1;
    bool parallel = false;
};

std::string_view to_string(Phase phase);
std::string_view to_string(Environment env);
std::optional<Phase> parse_phase(std::string_view name);
std::optional<Environment> parse_environment(std::string_view name);

/// @brief KILN_ENV, then well-known CI variables, else Local.
Environment detect_environment();

PhaseProfile calibrated_profile(Phase phase, Environment env);

class Scheduler {
public:
    struct Options {
        bool parallel = true;
        size_t max_workers = 0; ///< 0 keeps the calibrated optimum
        std::optional<Environment> environment;
        std::map<Phase, PhaseProfile> overrides;
    };

    Scheduler();
    explicit Scheduler(Options options);

    /**
     * @brief Decides whether, and how wide, to run `task_count` tasks of `phase`.
     *
     * Sequential below the break-even threshold or when parallelism is disabled.
     * Otherwise `min(optimal for the workload size, contention point)`, never
     * more workers than tasks.
     */
    ScheduleDecision choose(Phase phase, size_t task_count) const;

    const PhaseProfile &profile(Phase phase) const {
        return profiles_[static_cast<size_t>(phase)];
    }

    Environment environment() const {
        return env_;
    }

private:
    std::array<PhaseProfile, PHASE_COUNT> profiles_;
    Environment env_;
    bool parallel_;
    size_t max_workers_;
};

/// @brief Relative cost of a task from its input size: 1.0, +0.5 per 10 KB above 10 KB, capped at 5.0.
double task_weight(uint64_t bytes);

/// @brief Task indices, heaviest first; ties keep their original order.
std::vector<size_t> order_by_weight(const std::vector<double> &weights);

} // namespace kiln
