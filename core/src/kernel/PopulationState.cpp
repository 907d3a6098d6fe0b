#include "kernel/PopulationState.h"
#include "modules/ResourceDynamics.h"
#include "utils/Validation.h"

#include <stdexcept>
#include <string>

// ---------- Transaction (lock already held) ----------

const std::vector<double>& PopulationState::Transaction::resources() const {
    return state_.q_;
}

std::vector<double> PopulationState::Transaction::fractions() const {
    return state_.fractionsUnlocked();
}

std::uint32_t PopulationState::Transaction::taskOf(std::uint32_t agent) const {
    state_.checkAgent(agent);
    return state_.tasks_[agent];
}

bool PopulationState::Transaction::isAlive(std::uint32_t agent) const {
    state_.checkAgent(agent);
    return state_.alive_[agent] != 0;
}

std::uint32_t PopulationState::Transaction::active() const {
    return state_.active_;
}

double PopulationState::Transaction::time() const {
    return state_.time_;
}

bool PopulationState::Transaction::applyTaskChange(std::uint32_t agent, std::uint32_t task) {
    return state_.moveUnlocked(agent, task);
}

// ---------- PopulationState ----------

void PopulationState::configure(std::uint32_t numTasks, const std::vector<std::uint32_t>& initialTasks,
                                const std::vector<double>& initialResources) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation::requireSize(initialResources.size(), numTasks, "initial resources");

    q_ = initialResources;
    counts_.assign(numTasks, 0);
    tasks_ = initialTasks;
    alive_.assign(initialTasks.size(), 1);
    active_ = static_cast<std::uint32_t>(initialTasks.size());
    time_ = 0.0;

    for (std::size_t k = 0; k < tasks_.size(); ++k) {
        if (tasks_[k] >= numTasks) {
            throw std::invalid_argument("agent " + std::to_string(k) + " starts on task " +
                                        std::to_string(tasks_[k]) + " but only " +
                                        std::to_string(numTasks) + " tasks exist");
        }
        counts_[tasks_[k]]++;
    }
}

void PopulationState::checkAgent(std::uint32_t agent) const {
    if (agent >= tasks_.size()) {
        throw std::out_of_range("agent index " + std::to_string(agent) + " out of range");
    }
}

void PopulationState::checkTask(std::uint32_t task) const {
    if (task >= counts_.size()) {
        throw std::out_of_range("task index " + std::to_string(task) + " out of range");
    }
}

std::vector<double> PopulationState::fractionsUnlocked() const {
    std::vector<double> x(counts_.size(), 0.0);
    if (active_ == 0) {
        return x;
    }
    const double inv = 1.0 / static_cast<double>(active_);
    for (std::size_t i = 0; i < counts_.size(); ++i) {
        x[i] = counts_[i] * inv;
    }
    return x;
}

bool PopulationState::moveUnlocked(std::uint32_t agent, std::uint32_t task) {
    checkAgent(agent);
    checkTask(task);
    if (!alive_[agent]) {
        throw std::out_of_range("agent " + std::to_string(agent) + " has failed");
    }
    const std::uint32_t from = tasks_[agent];
    if (from == task) {
        return false;
    }
    counts_[from]--;
    counts_[task]++;
    tasks_[agent] = task;
    return true;
}

bool PopulationState::applyTaskChange(std::uint32_t agent, std::uint32_t task) {
    std::lock_guard<std::mutex> lock(mutex_);
    return moveUnlocked(agent, task);
}

void PopulationState::applyIntegration(const ResourceDynamics& dynamics, double until) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (until <= time_) {
        return;
    }
    dynamics.integrate(q_, fractionsUnlocked(), until - time_);
    time_ = until;
}

bool PopulationState::removeAgent(std::uint32_t agent) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkAgent(agent);
    if (!alive_[agent]) {
        return false;
    }
    alive_[agent] = 0;
    counts_[tasks_[agent]]--;
    active_--;
    return true;
}

bool PopulationState::confirmTask(std::uint32_t agent, std::uint32_t task) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkAgent(agent);
    if (!alive_[agent]) {
        return false;
    }
    return moveUnlocked(agent, task);
}

PopulationSnapshot PopulationState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PopulationSnapshot s;
    s.time = time_;
    s.q = q_;
    s.x = fractionsUnlocked();
    s.counts = counts_;
    s.active = active_;
    return s;
}

std::vector<double> PopulationState::fractions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fractionsUnlocked();
}

std::vector<double> PopulationState::resources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return q_;
}

std::vector<std::uint32_t> PopulationState::counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_;
}

std::uint32_t PopulationState::taskOf(std::uint32_t agent) const {
    std::lock_guard<std::mutex> lock(mutex_);
    checkAgent(agent);
    return tasks_[agent];
}

bool PopulationState::isAlive(std::uint32_t agent) const {
    std::lock_guard<std::mutex> lock(mutex_);
    checkAgent(agent);
    return alive_[agent] != 0;
}

std::uint32_t PopulationState::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::uint32_t PopulationState::numAgents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::uint32_t>(tasks_.size());
}

std::uint32_t PopulationState::numTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::uint32_t>(counts_.size());
}

double PopulationState::time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return time_;
}
