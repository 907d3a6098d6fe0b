#include "modules/Ensemble.h"

#include <stdexcept>
#include <string>

Ensemble::Ensemble(const EngineConfig& base) : base_(base) {
    // Fail on a bad configuration here rather than inside the parallel region
    Engine validated(base_);
    (void)validated;
}

std::uint64_t Ensemble::replicateSeed(std::uint64_t seed, std::uint32_t replicate) {
    if (replicate == 0) {
        return seed;
    }
    return seed ^ (static_cast<std::uint64_t>(replicate) * 0x9E3779B97F4A7C15ULL);
}

ReplicateResult Ensemble::runReplicate(const EngineConfig& cfg) {
    Engine engine(cfg);
    engine.run();

    const auto m = engine.computeMetrics();
    ReplicateResult r;
    r.seed = cfg.seed;
    r.state = engine.state();
    r.reason = engine.terminationReason();
    r.endTime = engine.time();
    r.q = m.q;
    r.x = m.x;
    r.revisions = m.revisions;
    r.switches = m.switches;
    r.convergedAt = engine.convergence().convergedAt();
    r.balance = m.balance;
    return r;
}

std::vector<ReplicateResult> Ensemble::run(std::uint32_t replicates) const {
    std::vector<ReplicateResult> results(replicates);
    std::vector<std::string> errors(replicates);
    const long n = static_cast<long>(replicates);

    #pragma omp parallel for schedule(dynamic)
    for (long r = 0; r < n; ++r) {
        EngineConfig cfg = base_;
        cfg.seed = replicateSeed(base_.seed, static_cast<std::uint32_t>(r));
        // Exceptions must not leave the parallel region
        try {
            results[r] = runReplicate(cfg);
        } catch (const std::exception& e) {
            errors[r] = e.what();
        }
    }

    for (std::uint32_t r = 0; r < replicates; ++r) {
        if (!errors[r].empty()) {
            throw std::runtime_error("replicate " + std::to_string(r) + " failed: " + errors[r]);
        }
    }
    return results;
}

EnsembleSummary Ensemble::summarize(const std::vector<ReplicateResult>& results) {
    EnsembleSummary s;
    if (results.empty()) {
        return s;
    }
    const std::size_t tasks = results.front().x.size();
    s.meanX.assign(tasks, 0.0);
    s.meanQ.assign(tasks, 0.0);

    for (const auto& r : results) {
        for (std::size_t i = 0; i < tasks; ++i) {
            s.meanX[i] += r.x[i];
            s.meanQ[i] += r.q[i];
        }
        s.meanSwitches += static_cast<double>(r.switches);
        s.meanBalance += r.balance;
        if (r.state == EngineState::Converged) s.converged++;
    }

    const double inv = 1.0 / static_cast<double>(results.size());
    for (std::size_t i = 0; i < tasks; ++i) {
        s.meanX[i] *= inv;
        s.meanQ[i] *= inv;
    }
    s.meanSwitches *= inv;
    s.meanBalance *= inv;
    return s;
}
