#ifndef SCENARIO_H
#define SCENARIO_H

#include <cstdint>
#include <random>
#include <vector>

// Temporary change of one task's growth rate over [start, end)
struct GrowthSurge {
    double start = 500.0;
    double end = 600.0;
    std::uint32_t task = 0;
    double rate = 5.0;
};

// Permanent failure of `count` randomly chosen live agents at `time`
struct FailureWave {
    double time = 500.0;
    std::uint32_t count = 15;
};

struct ScenarioConfig {
    std::vector<GrowthSurge> surges;
    std::vector<FailureWave> failures;
};

enum class ScenarioActionKind : std::uint8_t {
    SetGrowthRate = 0,
    FailAgents = 1
};

struct ScenarioAction {
    double time = 0.0;
    ScenarioActionKind kind = ScenarioActionKind::SetGrowthRate;
    std::uint32_t task = 0;
    double rate = 0.0;
    std::uint32_t count = 0;
};

/**
 * Scheduled perturbations of a running experiment: growth-rate surges and
 * agent failure waves. A surge expands into a "set rate" action at its start
 * and a "restore base rate" action at its end. Actions are kept sorted by
 * time, in declaration order for equal times.
 */
class Scenario {
public:
    void configure(const ScenarioConfig& cfg, const std::vector<double>& baseGrowthRates,
                   std::uint64_t seed);

    bool hasPending() const { return cursor_ < actions_.size(); }
    double nextTime() const;
    ScenarioAction popNext();

    // Choose `count` distinct agents from `live` (all of them if fewer)
    std::vector<std::uint32_t> pickFailures(const std::vector<std::uint32_t>& live, std::uint32_t count);

    const std::vector<ScenarioAction>& actions() const { return actions_; }

private:
    std::vector<ScenarioAction> actions_;
    std::size_t cursor_ = 0;
    std::mt19937_64 rng_{};
};

#endif
