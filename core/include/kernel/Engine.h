#ifndef ENGINE_H
#define ENGINE_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "kernel/Agent.h"
#include "kernel/EventQueue.h"
#include "kernel/PopulationState.h"
#include "modules/ConvergenceMonitor.h"
#include "modules/PayoffMechanism.h"
#include "modules/ResourceDynamics.h"
#include "modules/RevisionClock.h"
#include "modules/RevisionProtocol.h"
#include "modules/Scenario.h"
#include "utils/EventLog.h"

// ---------- Default Constants ----------
// Values of the reference foraging experiment (trash-collection patches).
namespace EngineDefaults {
    constexpr std::uint32_t kAgents = 40;
    constexpr std::uint32_t kTasks = 4;
    constexpr double kRevisionRate = 1.0 / 8.0;   // one revision every 8 s on average
    constexpr double kRho = 1.0 / 600.0;
    constexpr double kHorizon = 2000.0;           // seconds
    constexpr double kTickInterval = 0.1;         // resource integration tick
    constexpr double kIntegrationStep = 0.05;     // RK4 sub-step, well below 2 / (alpha R)
}

// ---------- Configuration ----------
enum class InitialAssignment : std::uint8_t {
    RoundRobin = 0,  // agent k starts on task k mod M
    SingleTask = 1,  // everyone starts on initialTask
    Explicit = 2     // initialTasks[k]
};

struct EngineConfig {
    std::uint32_t agents = EngineDefaults::kAgents;
    std::uint32_t tasks = EngineDefaults::kTasks;
    double revisionRate = EngineDefaults::kRevisionRate;  // lambda
    double rho = EngineDefaults::kRho;
    double nu = 0.0;                  // payoff model weight
    double referenceLevel = 0.0;      // gamma*
    std::vector<TaskParams> taskParams;      // empty: `tasks` copies of TaskParams{}
    std::vector<double> initialResources;    // empty: all zero

    InitialAssignment assignment = InitialAssignment::RoundRobin;
    std::uint32_t initialTask = 0;
    std::vector<std::uint32_t> initialTasks;

    double horizon = EngineDefaults::kHorizon;
    double tickInterval = EngineDefaults::kTickInterval;
    double integrationStep = EngineDefaults::kIntegrationStep;
    bool clampResources = false;      // keep q >= 0 like the physical patches
    // Construction rejects rho (M - 1) gap > 1 for gap = max(maxPayoffGap,
    // spread of the initial payoffs). Wider gaps reached later in a run are
    // caught by the per-revision check, which ends the run with an error.
    double maxPayoffGap = 0.0;
    std::uint64_t seed = 42;

    ConvergenceSettings convergence;
    ScenarioConfig scenario;
    std::size_t eventLogCapacity = 1000000;
};

enum class EngineState : std::uint8_t {
    Idle = 0,
    Running = 1,
    Converged = 2,
    Terminated = 3
};

enum class TerminationReason : std::uint8_t {
    None = 0,
    Horizon = 1,
    StopRequested = 2,
    Extinct = 3,      // every agent has failed
    Error = 4         // a step threw; the exception was passed to the caller
};

const char* engineStateName(EngineState state);
const char* terminationReasonName(TerminationReason reason);

// ---------- Simulation Engine ----------
/**
 * Discrete-event population game.
 *
 * Three event sources are merged in time order: fixed resource ticks,
 * scheduled scenario actions and per-agent Poisson revisions. On equal
 * timestamps a tick goes first, then scenario actions, then revisions by
 * ascending agent index. Revisions see the resource levels of the latest
 * integration and the current population shares.
 */
class Engine {
public:
    using DirectiveSink = std::function<void(const Directive&)>;
    using TickObserver = std::function<void(const Engine&)>;

    // Validates the configuration; throws std::invalid_argument on error
    explicit Engine(const EngineConfig& cfg);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Lifecycle
    void start();
    bool stepEvent();
    void runUntil(double t);
    void runFor(double dt);
    void run();
    void requestStop();  // safe from any thread

    // Platform input
    void observe(const std::vector<AgentObservation>& observations);
    void failAgent(std::uint32_t agent);
    void setGrowthRate(std::uint32_t task, double w);

    // Observability hooks
    void setDirectiveSink(DirectiveSink sink) { directive_sink_ = std::move(sink); }
    void setTickObserver(TickObserver observer) { tick_observer_ = std::move(observer); }

    // Access
    EngineState state() const { return state_; }
    TerminationReason terminationReason() const { return termination_; }
    bool finished() const { return state_ == EngineState::Converged || state_ == EngineState::Terminated; }
    double time() const { return time_; }
    std::uint64_t ticks() const { return ticks_; }
    std::uint64_t revisions() const { return revisions_; }
    std::uint64_t switches() const { return switches_; }
    std::uint64_t corrections() const { return corrections_; }
    std::size_t pendingRevisions() const { return queue_.size(); }

    const EngineConfig& config() const { return cfg_; }
    const PopulationState& population() const { return population_; }
    const ResourceDynamics& dynamics() const { return dynamics_; }
    const PayoffMechanism& payoffMechanism() const { return payoff_; }
    const RevisionProtocol& protocol() const { return protocol_; }
    const ConvergenceMonitor& convergence() const { return monitor_; }
    const EventLog& eventLog() const { return event_log_; }

    Agent agent(std::uint32_t id) const;
    std::vector<double> currentPayoffs() const;

    // Metrics (lightweight for logging)
    struct Metrics {
        double time = 0.0;
        std::vector<double> q;
        std::vector<double> x;
        std::vector<std::uint32_t> counts;
        std::vector<double> w;
        std::vector<double> payoffs;
        std::uint32_t active = 0;
        std::uint64_t revisions = 0;
        std::uint64_t switches = 0;
        double populationVariance = 0.0;
        double payoffGap = 0.0;
        double totalResource = 0.0;
        double balance = 1.0;  // 1 - (max x - min x)
    };
    Metrics computeMetrics() const;

private:
    void validateConfig() const;
    std::vector<std::uint32_t> buildInitialTasks() const;
    void requireMutable(const char* operation) const;
    void transition(EngineState next, TerminationReason reason = TerminationReason::None);

    double nextTickTime() const;
    double peekRevisionTime();
    void processTick(double tickTime);
    void processScenario();
    void processRevision();
    void finishAtHorizon();
    void removeAgent(std::uint32_t agent);

    EngineConfig cfg_;
    EngineState state_ = EngineState::Idle;
    TerminationReason termination_ = TerminationReason::None;
    std::atomic<bool> stop_requested_{false};

    double time_ = 0.0;
    std::uint64_t ticks_ = 0;
    std::uint64_t revisions_ = 0;
    std::uint64_t switches_ = 0;
    std::uint64_t corrections_ = 0;

    ResourceDynamics dynamics_;
    PayoffMechanism payoff_;
    RevisionProtocol protocol_;
    PopulationState population_;
    std::vector<RevisionClock> clocks_;
    EventQueue queue_;
    ConvergenceMonitor monitor_;
    Scenario scenario_;
    EventLog event_log_;

    DirectiveSink directive_sink_;
    TickObserver tick_observer_;
};

#endif // ENGINE_H
