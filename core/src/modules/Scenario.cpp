#include "modules/Scenario.h"
#include "utils/Validation.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

void Scenario::configure(const ScenarioConfig& cfg, const std::vector<double>& baseGrowthRates,
                         std::uint64_t seed) {
    actions_.clear();
    cursor_ = 0;
    rng_.seed(seed);

    const auto numTasks = static_cast<std::uint32_t>(baseGrowthRates.size());
    for (std::size_t s = 0; s < cfg.surges.size(); ++s) {
        const auto& surge = cfg.surges[s];
        const std::string tag = "surge " + std::to_string(s);
        if (surge.task >= numTasks) {
            throw std::invalid_argument(tag + ": task " + std::to_string(surge.task) +
                                        " out of range");
        }
        if (!(surge.start >= 0.0) || !(surge.end > surge.start)) {
            throw std::invalid_argument(tag + ": needs 0 <= start < end");
        }
        validation::requireFinite(surge.rate, "surge rate");

        ScenarioAction begin;
        begin.time = surge.start;
        begin.kind = ScenarioActionKind::SetGrowthRate;
        begin.task = surge.task;
        begin.rate = surge.rate;
        actions_.push_back(begin);

        ScenarioAction restore = begin;
        restore.time = surge.end;
        restore.rate = baseGrowthRates[surge.task];
        actions_.push_back(restore);
    }

    for (std::size_t f = 0; f < cfg.failures.size(); ++f) {
        const auto& wave = cfg.failures[f];
        if (!(wave.time >= 0.0) || !std::isfinite(wave.time)) {
            throw std::invalid_argument("failure wave " + std::to_string(f) + ": time must be >= 0");
        }
        ScenarioAction fail;
        fail.time = wave.time;
        fail.kind = ScenarioActionKind::FailAgents;
        fail.count = wave.count;
        actions_.push_back(fail);
    }

    std::stable_sort(actions_.begin(), actions_.end(),
                     [](const ScenarioAction& a, const ScenarioAction& b) { return a.time < b.time; });
}

double Scenario::nextTime() const {
    if (!hasPending()) {
        return std::numeric_limits<double>::infinity();
    }
    return actions_[cursor_].time;
}

ScenarioAction Scenario::popNext() {
    if (!hasPending()) {
        throw std::logic_error("no pending scenario action");
    }
    return actions_[cursor_++];
}

std::vector<std::uint32_t> Scenario::pickFailures(const std::vector<std::uint32_t>& live,
                                                  std::uint32_t count) {
    std::vector<std::uint32_t> pool = live;
    const std::size_t n = std::min<std::size_t>(count, pool.size());

    // Partial Fisher-Yates over the live pool
    for (std::size_t i = 0; i < n; ++i) {
        std::uniform_int_distribution<std::size_t> pick(i, pool.size() - 1);
        std::swap(pool[i], pool[pick(rng_)]);
    }
    pool.resize(n);
    std::sort(pool.begin(), pool.end());
    return pool;
}
