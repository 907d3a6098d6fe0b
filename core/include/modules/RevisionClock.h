#ifndef REVISION_CLOCK_H
#define REVISION_CLOCK_H

#include <cstdint>
#include <random>

/**
 * Per-agent Poisson revision clock
 *
 * Inter-event intervals are Exp(lambda). Every clock owns its own generator,
 * seeded from (seed, agent) through a SplitMix64 mixer, so one agent's draws
 * never consume another agent's stream. The same generator also serves as the
 * agent's source for revision-protocol draws.
 */
class RevisionClock {
public:
    RevisionClock(double rate, std::uint64_t seed, std::uint32_t agent);

    // Draw the next revision time after `now`; result is strictly > now
    double schedule(double now);

    double nextTime() const { return next_time_; }
    double rate() const { return rate_; }
    std::uint64_t draws() const { return draws_; }
    std::mt19937_64& rng() { return rng_; }

    static std::uint64_t streamSeed(std::uint64_t seed, std::uint32_t agent);

private:
    double rate_;
    double next_time_ = 0.0;
    std::uint64_t draws_ = 0;
    std::mt19937_64 rng_;
    std::exponential_distribution<double> interval_;
};

#endif
