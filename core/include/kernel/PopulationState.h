#ifndef POPULATION_STATE_H
#define POPULATION_STATE_H

#include <cstdint>
#include <mutex>
#include <vector>

class ResourceDynamics;

// Consistent (q, x, t) view handed to the payoff mechanism and observers
struct PopulationSnapshot {
    double time = 0.0;                  // time the resource levels are valid at
    std::vector<double> q;              // resource level per task
    std::vector<double> x;              // population share per task
    std::vector<std::uint32_t> counts;  // live agents per task
    std::uint32_t active = 0;           // live agents in total
};

/**
 * Owner of the shared simulation state: resource levels, per-task head
 * counts and each agent's task/liveness.
 *
 * Shares are derived as x_i = count_i / active, so they always sum to one
 * over the live population and can never go negative. Every public operation
 * holds the internal mutex; transact() keeps it held across a whole
 * read-decide-apply sequence.
 */
class PopulationState {
public:
    class Transaction {
    public:
        const std::vector<double>& resources() const;
        std::vector<double> fractions() const;
        std::uint32_t taskOf(std::uint32_t agent) const;
        bool isAlive(std::uint32_t agent) const;
        std::uint32_t active() const;
        double time() const;
        bool applyTaskChange(std::uint32_t agent, std::uint32_t task);

    private:
        friend class PopulationState;
        explicit Transaction(PopulationState& state) : state_(state) {}
        PopulationState& state_;
    };

    void configure(std::uint32_t numTasks, const std::vector<std::uint32_t>& initialTasks,
                   const std::vector<double>& initialResources);

    // Move one agent between task buckets. Returns false when the agent is
    // already on `task`. Throws std::out_of_range for bad indices or a failed agent.
    bool applyTaskChange(std::uint32_t agent, std::uint32_t task);

    // Advance q from the current resource time to `until` using the current
    // shares; the resource time becomes exactly `until`.
    void applyIntegration(const ResourceDynamics& dynamics, double until);

    // Permanently remove an agent. Returns false if it was already removed.
    bool removeAgent(std::uint32_t agent);

    // External task confirmation; corrects the bucket if it disagrees.
    // Returns true when a correction was applied.
    bool confirmTask(std::uint32_t agent, std::uint32_t task);

    PopulationSnapshot snapshot() const;
    std::vector<double> fractions() const;
    std::vector<double> resources() const;
    std::vector<std::uint32_t> counts() const;
    std::uint32_t taskOf(std::uint32_t agent) const;
    bool isAlive(std::uint32_t agent) const;
    std::uint32_t active() const;
    std::uint32_t numAgents() const;
    std::uint32_t numTasks() const;
    double time() const;

    template <typename Fn>
    decltype(auto) transact(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        Transaction tx(*this);
        return fn(tx);
    }

private:
    void checkAgent(std::uint32_t agent) const;
    void checkTask(std::uint32_t task) const;
    std::vector<double> fractionsUnlocked() const;
    bool moveUnlocked(std::uint32_t agent, std::uint32_t task);

    mutable std::mutex mutex_;
    std::vector<double> q_;
    std::vector<std::uint32_t> counts_;
    std::vector<std::uint32_t> tasks_;
    std::vector<std::uint8_t> alive_;
    std::uint32_t active_ = 0;
    double time_ = 0.0;
};

#endif
