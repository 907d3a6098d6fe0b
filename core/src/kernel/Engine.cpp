#include "kernel/Engine.h"
#include "utils/Validation.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace {
    constexpr double kInfinity = std::numeric_limits<double>::infinity();
    constexpr std::uint64_t kScenarioSeedMix = 0xD1B54A32D192ED03ULL;
}

const char* engineStateName(EngineState state) {
    switch (state) {
        case EngineState::Idle:       return "idle";
        case EngineState::Running:    return "running";
        case EngineState::Converged:  return "converged";
        case EngineState::Terminated: return "terminated";
    }
    return "unknown";
}

const char* terminationReasonName(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::None:          return "none";
        case TerminationReason::Horizon:       return "horizon";
        case TerminationReason::StopRequested: return "stop";
        case TerminationReason::Extinct:       return "extinct";
        case TerminationReason::Error:         return "error";
    }
    return "unknown";
}

Engine::Engine(const EngineConfig& cfg) : cfg_(cfg), event_log_(cfg.eventLogCapacity) {
    validateConfig();

    if (cfg_.taskParams.empty()) {
        cfg_.taskParams.assign(cfg_.tasks, TaskParams{});
    }
    if (cfg_.initialResources.empty()) {
        cfg_.initialResources.assign(cfg_.tasks, 0.0);
    }

    dynamics_.configure(cfg_.taskParams, cfg_.integrationStep, cfg_.clampResources);
    payoff_.configure(cfg_.nu, cfg_.referenceLevel);
    protocol_.configure(cfg_.rho);
    monitor_.configure(cfg_.convergence);
    scenario_.configure(cfg_.scenario, dynamics_.growthRates(), cfg_.seed ^ kScenarioSeedMix);

    population_.configure(cfg_.tasks, buildInitialTasks(), cfg_.initialResources);

    // The payoff spread at t = 0 is always reachable; a declared bound may be wider
    const auto initial = population_.snapshot();
    const auto payoffs = payoff_.payoffs(dynamics_, initial.q, initial.x);
    const auto [lo, hi] = std::minmax_element(payoffs.begin(), payoffs.end());
    RevisionProtocol::validateBound(cfg_.rho, cfg_.tasks, std::max(cfg_.maxPayoffGap, *hi - *lo));

    // Every agent draws its first revision time at creation
    clocks_.reserve(cfg_.agents);
    queue_.reserve(cfg_.agents);
    for (std::uint32_t k = 0; k < cfg_.agents; ++k) {
        clocks_.emplace_back(cfg_.revisionRate, cfg_.seed, k);
        queue_.push(clocks_.back().schedule(0.0), k);
    }
}

void Engine::validateConfig() const {
    if (cfg_.agents == 0) {
        throw std::invalid_argument("agents must be > 0");
    }
    if (cfg_.tasks == 0) {
        throw std::invalid_argument("tasks must be > 0");
    }
    validation::requirePositive(cfg_.revisionRate, "revisionRate (lambda)");
    validation::requirePositive(cfg_.rho, "rho");
    validation::requirePositive(cfg_.horizon, "horizon");
    validation::requirePositive(cfg_.tickInterval, "tickInterval");
    validation::requirePositive(cfg_.integrationStep, "integrationStep");
    validation::requireFinite(cfg_.maxPayoffGap, "maxPayoffGap");

    if (!cfg_.taskParams.empty()) {
        validation::requireSize(cfg_.taskParams.size(), cfg_.tasks, "taskParams");
    }
    if (!cfg_.initialResources.empty()) {
        validation::requireSize(cfg_.initialResources.size(), cfg_.tasks, "initialResources");
        for (double q : cfg_.initialResources) {
            validation::requireFinite(q, "initial resource level");
        }
    }

    switch (cfg_.assignment) {
        case InitialAssignment::RoundRobin:
            break;
        case InitialAssignment::SingleTask:
            if (cfg_.initialTask >= cfg_.tasks) {
                throw std::invalid_argument("initialTask " + std::to_string(cfg_.initialTask) +
                                            " out of range");
            }
            break;
        case InitialAssignment::Explicit:
            validation::requireSize(cfg_.initialTasks.size(), cfg_.agents, "initialTasks");
            for (auto t : cfg_.initialTasks) {
                if (t >= cfg_.tasks) {
                    throw std::invalid_argument("initialTasks entry " + std::to_string(t) +
                                                " out of range");
                }
            }
            break;
    }
}

std::vector<std::uint32_t> Engine::buildInitialTasks() const {
    switch (cfg_.assignment) {
        case InitialAssignment::SingleTask:
            return std::vector<std::uint32_t>(cfg_.agents, cfg_.initialTask);
        case InitialAssignment::Explicit:
            return cfg_.initialTasks;
        case InitialAssignment::RoundRobin:
            break;
    }
    std::vector<std::uint32_t> tasks(cfg_.agents);
    for (std::uint32_t k = 0; k < cfg_.agents; ++k) {
        tasks[k] = k % cfg_.tasks;
    }
    return tasks;
}

void Engine::requireMutable(const char* operation) const {
    if (finished()) {
        throw std::logic_error(std::string(operation) + " called after the engine stopped (" +
                               engineStateName(state_) + ")");
    }
}

void Engine::transition(EngineState next, TerminationReason reason) {
    event_log_.logStateChange(time_, static_cast<int>(state_), static_cast<int>(next));
    state_ = next;
    termination_ = reason;
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void Engine::start() {
    if (state_ != EngineState::Idle) {
        throw std::logic_error(std::string("start() requires an idle engine (state: ") +
                               engineStateName(state_) + ")");
    }
    transition(EngineState::Running);
}

void Engine::requestStop() {
    stop_requested_.store(true, std::memory_order_release);
}

double Engine::nextTickTime() const {
    // Computed from the tick count so tick times do not accumulate rounding
    return static_cast<double>(ticks_ + 1) * cfg_.tickInterval;
}

double Engine::peekRevisionTime() {
    // Failed agents keep one stale entry until it surfaces here
    while (!queue_.empty() && !population_.isAlive(queue_.top().agent)) {
        queue_.pop();
    }
    return queue_.empty() ? kInfinity : queue_.top().time;
}

bool Engine::stepEvent() {
    if (state_ != EngineState::Running) {
        return false;
    }
    if (stop_requested_.load(std::memory_order_acquire)) {
        transition(EngineState::Terminated, TerminationReason::StopRequested);
        return false;
    }
    if (population_.active() == 0) {
        transition(EngineState::Terminated, TerminationReason::Extinct);
        return false;
    }

    const double tickTime = nextTickTime();
    const double scenarioTime = scenario_.nextTime();
    const double revisionTime = peekRevisionTime();
    const double next = std::min({tickTime, scenarioTime, revisionTime});

    if (next > cfg_.horizon) {
        finishAtHorizon();
        return false;
    }

    try {
        if (tickTime <= scenarioTime && tickTime <= revisionTime) {
            processTick(tickTime);
        } else if (scenarioTime <= revisionTime) {
            processScenario();
        } else {
            processRevision();
        }
    } catch (const std::exception&) {
        // A fatal numeric error ends the run; the caller gets the exception
        transition(EngineState::Terminated, TerminationReason::Error);
        throw;
    }
    return state_ == EngineState::Running;
}

void Engine::runUntil(double t) {
    if (state_ == EngineState::Idle) {
        throw std::logic_error("runUntil() before start()");
    }
    while (state_ == EngineState::Running) {
        if (stop_requested_.load(std::memory_order_acquire)) {
            transition(EngineState::Terminated, TerminationReason::StopRequested);
            break;
        }
        const double next = std::min({nextTickTime(), scenario_.nextTime(), peekRevisionTime()});
        if (next > t || next > cfg_.horizon) {
            break;
        }
        stepEvent();
    }
    if (state_ == EngineState::Running) {
        if (t >= cfg_.horizon) {
            finishAtHorizon();
        } else {
            time_ = std::max(time_, t);
        }
    }
}

void Engine::runFor(double dt) {
    runUntil(time_ + dt);
}

void Engine::run() {
    if (state_ == EngineState::Idle) {
        start();
    }
    runUntil(cfg_.horizon);
}

void Engine::finishAtHorizon() {
    try {
        population_.applyIntegration(dynamics_, cfg_.horizon);
    } catch (const std::exception&) {
        transition(EngineState::Terminated, TerminationReason::Error);
        throw;
    }
    time_ = cfg_.horizon;
    transition(EngineState::Terminated, TerminationReason::Horizon);
}

// ============================================================================
// EVENT HANDLERS
// ============================================================================

void Engine::processTick(double tickTime) {
    population_.applyIntegration(dynamics_, tickTime);
    time_ = tickTime;
    ++ticks_;

    if (tick_observer_) {
        tick_observer_(*this);
    }

    if (monitor_.settings().enabled) {
        const auto snap = population_.snapshot();
        const auto payoffs = payoff_.payoffs(dynamics_, snap.q, snap.x);
        if (monitor_.update(tickTime, snap.x, payoffs)) {
            transition(EngineState::Converged);
        }
    }
}

void Engine::processScenario() {
    const ScenarioAction action = scenario_.popNext();

    // Bring resources up to the action time before perturbing them
    population_.applyIntegration(dynamics_, action.time);
    time_ = std::max(time_, action.time);

    switch (action.kind) {
        case ScenarioActionKind::SetGrowthRate: {
            const double previous = dynamics_.growthRate(action.task);
            dynamics_.setGrowthRate(action.task, action.rate);
            event_log_.logGrowthChange(time_, action.task, previous, action.rate);
            break;
        }
        case ScenarioActionKind::FailAgents: {
            std::vector<std::uint32_t> live;
            live.reserve(cfg_.agents);
            for (std::uint32_t k = 0; k < cfg_.agents; ++k) {
                if (population_.isAlive(k)) live.push_back(k);
            }
            for (auto k : scenario_.pickFailures(live, action.count)) {
                removeAgent(k);
            }
            break;
        }
    }
}

void Engine::processRevision() {
    const RevisionEvent event = queue_.pop();
    time_ = event.time;
    RevisionClock& clock = clocks_[event.agent];

    // Read, decide and apply under one lock so no other mutation interleaves
    const RevisionDecision decision = population_.transact([&](PopulationState::Transaction& tx) {
        const std::uint32_t current = tx.taskOf(event.agent);
        const auto payoffs = payoff_.payoffs(dynamics_, tx.resources(), tx.fractions());
        RevisionDecision d = protocol_.sample(current, payoffs, clock.rng());
        if (d.switched) {
            tx.applyTaskChange(event.agent, d.to);
        }
        return d;
    });

    ++revisions_;
    if (decision.switched) {
        ++switches_;
        event_log_.logReassignment(time_, event.agent, decision.from, decision.to);
    }

    if (directive_sink_) {
        Directive d;
        d.time = time_;
        d.agent = event.agent;
        d.from = decision.from;
        d.to = decision.to;
        d.change = decision.switched;
        directive_sink_(d);
    }

    queue_.push(clock.schedule(time_), event.agent);
}

// ============================================================================
// PLATFORM INPUT
// ============================================================================

void Engine::removeAgent(std::uint32_t agent) {
    const std::uint32_t task = population_.taskOf(agent);
    if (!population_.removeAgent(agent)) {
        return;
    }
    event_log_.logFailure(time_, agent, task);
    if (population_.active() == 0 && state_ == EngineState::Running) {
        transition(EngineState::Terminated, TerminationReason::Extinct);
    }
}

void Engine::observe(const std::vector<AgentObservation>& observations) {
    requireMutable("observe()");
    for (const auto& obs : observations) {
        if (obs.agent >= cfg_.agents) {
            throw std::out_of_range("observation for unknown agent " + std::to_string(obs.agent));
        }
        if (!obs.alive) {
            removeAgent(obs.agent);
            continue;
        }
        if (obs.task >= 0 && population_.confirmTask(obs.agent, static_cast<std::uint32_t>(obs.task))) {
            ++corrections_;
        }
    }
}

void Engine::failAgent(std::uint32_t agent) {
    requireMutable("failAgent()");
    removeAgent(agent);
}

void Engine::setGrowthRate(std::uint32_t task, double w) {
    requireMutable("setGrowthRate()");
    if (task >= cfg_.tasks) {
        throw std::out_of_range("task index " + std::to_string(task) + " out of range");
    }
    population_.applyIntegration(dynamics_, time_);
    const double previous = dynamics_.growthRate(task);
    dynamics_.setGrowthRate(task, w);
    event_log_.logGrowthChange(time_, task, previous, w);
}

// ============================================================================
// ACCESS
// ============================================================================

Agent Engine::agent(std::uint32_t id) const {
    if (id >= cfg_.agents) {
        throw std::out_of_range("agent index " + std::to_string(id) + " out of range");
    }
    Agent a;
    a.id = id;
    a.alive = population_.isAlive(id);
    a.task = population_.taskOf(id);
    a.nextRevisionTime = clocks_[id].nextTime();
    return a;
}

std::vector<double> Engine::currentPayoffs() const {
    const auto snap = population_.snapshot();
    return payoff_.payoffs(dynamics_, snap.q, snap.x);
}

Engine::Metrics Engine::computeMetrics() const {
    Metrics m;
    const auto snap = population_.snapshot();
    m.time = time_;
    m.q = snap.q;
    m.x = snap.x;
    m.counts = snap.counts;
    m.w = dynamics_.growthRates();
    m.payoffs = payoff_.payoffs(dynamics_, snap.q, snap.x);
    m.active = snap.active;
    m.revisions = revisions_;
    m.switches = switches_;
    m.populationVariance = ConvergenceMonitor::populationVariance(snap.x);
    m.payoffGap = ConvergenceMonitor::payoffGap(snap.x, m.payoffs);

    for (double q : snap.q) {
        m.totalResource += q;
    }
    if (!snap.x.empty()) {
        const auto [lo, hi] = std::minmax_element(snap.x.begin(), snap.x.end());
        m.balance = 1.0 - (*hi - *lo);
    }
    return m;
}
