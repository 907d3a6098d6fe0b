#ifndef ENSEMBLE_H
#define ENSEMBLE_H

#include <cstdint>
#include <string>
#include <vector>

#include "kernel/Engine.h"

// Outcome of one replicate run
struct ReplicateResult {
    std::uint64_t seed = 0;
    EngineState state = EngineState::Idle;
    TerminationReason reason = TerminationReason::None;
    double endTime = 0.0;
    std::vector<double> q;
    std::vector<double> x;
    std::uint64_t revisions = 0;
    std::uint64_t switches = 0;
    double convergedAt = -1.0;   // -1 when the monitor never fired
    double balance = 0.0;
};

struct EnsembleSummary {
    std::vector<double> meanX;
    std::vector<double> meanQ;
    double meanSwitches = 0.0;
    double meanBalance = 0.0;
    std::uint32_t converged = 0;
};

/**
 * Independent replicates of one configuration.
 *
 * Replicate r runs a fresh Engine seeded with replicateSeed(base.seed, r).
 * Replicates share nothing and run in parallel under OpenMP; results come
 * back in replicate order regardless of scheduling.
 */
class Ensemble {
public:
    explicit Ensemble(const EngineConfig& base);

    std::vector<ReplicateResult> run(std::uint32_t replicates) const;

    static std::uint64_t replicateSeed(std::uint64_t seed, std::uint32_t replicate);
    static ReplicateResult runReplicate(const EngineConfig& cfg);
    static EnsembleSummary summarize(const std::vector<ReplicateResult>& results);

private:
    EngineConfig base_;
};

#endif
