#pragma once

#include <cstdint>

// ---------- Agent Structure ----------
// Read-only view assembled from the population tracker and the agent's clock
struct Agent {
    // Identity
    std::uint32_t id = 0;
    bool alive = true;

    // Allocation
    std::uint32_t task = 0;
    double nextRevisionTime = 0.0;  // meaningless once the agent has failed
};

// ---------- Platform Interface ----------
// Per-agent report from the external platform
struct AgentObservation {
    std::uint32_t agent = 0;
    bool alive = true;
    std::int32_t task = -1;  // confirmed task, -1 when not reported
};

// Emitted after every revision sampling: either a reassignment or "no change"
struct Directive {
    double time = 0.0;
    std::uint32_t agent = 0;
    std::uint32_t from = 0;
    std::uint32_t to = 0;
    bool change = false;

    bool operator==(const Directive& other) const {
        return time == other.time && agent == other.agent && from == other.from &&
               to == other.to && change == other.change;
    }
};
