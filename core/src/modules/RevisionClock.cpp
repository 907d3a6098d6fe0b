#include "modules/RevisionClock.h"
#include "utils/Validation.h"

#include <cmath>
#include <limits>

namespace {
    std::uint64_t splitMix64(std::uint64_t z) {
        z += 0x9e3779b97f4a7c15ULL;
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
        return z ^ (z >> 31);
    }
}

std::uint64_t RevisionClock::streamSeed(std::uint64_t seed, std::uint32_t agent) {
    return splitMix64(seed ^ splitMix64(static_cast<std::uint64_t>(agent) + 1));
}

RevisionClock::RevisionClock(double rate, std::uint64_t seed, std::uint32_t agent)
    : rate_(rate), rng_(streamSeed(seed, agent)), interval_(1.0) {
    validation::requirePositive(rate, "revision rate lambda");
    interval_ = std::exponential_distribution<double>(rate);
}

double RevisionClock::schedule(double now) {
    double next = now + interval_(rng_);
    if (!(next > now)) {
        next = std::nextafter(now, std::numeric_limits<double>::infinity());
    }
    next_time_ = next;
    ++draws_;
    return next_time_;
}
