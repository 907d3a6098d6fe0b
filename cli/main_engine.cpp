#include "kernel/Engine.h"
#include "kernel/Presets.h"
#include "io/Snapshot.h"
#include "modules/Ensemble.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <cstdlib>

static void printHelp() {
    std::cerr << "Engine Commands:\n"
              << "  step N             # process N events\n"
              << "  run T log          # advance T seconds, log metrics every 'log' seconds\n"
              << "  finish             # run to the horizon\n"
              << "  state [agents]     # print JSON snapshot (optional: include agents)\n"
              << "  metrics            # print current metrics\n"
              << "  equilibrium        # print q* per task for the current shares\n"
              << "  fail K             # fail agent K\n"
              << "  growth T W         # set growth rate of task T to W\n"
              << "  events [N]         # print the last N logged events as CSV\n"
              << "  ensemble R         # run R replicates of the current configuration\n"
              << "  reset [preset]     # rebuild the engine (optional: new preset)\n"
              << "  quit               # exit\n"
              << "\nOptions: --preset=<name> --seed=<n> --agents=<n> --nu=<v> --horizon=<t>\n"
              << "Presets: baseline, surge, failures, modelbased (or TASKALLOC_PRESET env var)\n";
}

static void printMetrics(const Engine& engine) {
    auto m = engine.computeMetrics();
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "\n=== Metrics (t=" << m.time << ", " << engineStateName(engine.state()) << ") ===\n";
    std::cout << "Active agents: " << m.active << "\n";
    std::cout << "Revisions: " << m.revisions << "  Switches: " << m.switches << "\n";
    for (std::size_t i = 0; i < m.q.size(); ++i) {
        std::cout << "  task " << i
                  << ": q=" << std::setw(8) << m.q[i]
                  << "  x=" << std::setw(6) << m.x[i]
                  << "  n=" << std::setw(4) << m.counts[i]
                  << "  w=" << std::setw(6) << m.w[i]
                  << "  p=" << std::setw(8) << m.payoffs[i] << "\n";
    }
    std::cout << "Population variance: " << std::setprecision(5) << m.populationVariance << "\n";
    std::cout << "Payoff gap: " << std::setprecision(3) << m.payoffGap << "\n";
    std::cout << "Total resource: " << m.totalResource << "\n";
    std::cout << "Balance: " << m.balance << "\n\n";
    std::cout.flush();
}

int main(int argc, char** argv) {
    std::string preset = "baseline";
    if (const char* envPreset = std::getenv("TASKALLOC_PRESET")) {
        preset = envPreset;
    }

    EngineConfig cfg;
    std::vector<std::string> overrides;
    const char* scriptArg = nullptr;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            EngineConfig scratch;
            if (arg == "--help" || arg == "-h") {
                printHelp();
                return 0;
            } else if (arg.rfind("--preset=", 0) == 0) {
                preset = arg.substr(9);
            } else if (applyConfigOverride(arg, scratch)) {
                overrides.push_back(arg);
            } else if (arg.size() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << "\n";
                return 1;
            } else {
                scriptArg = argv[i];
                break;
            }
        }
        cfg = resolveConfig(preset, overrides);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<Engine> engine;
    try {
        engine = std::make_unique<Engine>(cfg);
        engine->start();
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid configuration: " << e.what() << "\n";
        return 1;
    }
    std::cerr << "Preset '" << canonicalPresetName(preset) << "': " << cfg.agents << " agents, "
              << cfg.tasks << " tasks, horizon " << cfg.horizon << " s, seed " << cfg.seed << "\n";

    // Check if there's a script file argument
    std::istream* input = &std::cin;
    std::ifstream scriptFile;

    if (scriptArg) {
        scriptFile.open(scriptArg);
        if (!scriptFile.is_open()) {
            std::cerr << "Error: Could not open script file '" << scriptArg << "'\n";
            return 1;
        }
        input = &scriptFile;
        std::cerr << "Running commands from script file: " << scriptArg << "\n";
    } else {
        // Interactive mode
        std::ios::sync_with_stdio(false);
        std::cin.tie(nullptr);
        printHelp();
    }

    std::string line;
    while (std::getline(*input, line)) {
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd) || cmd[0] == '#') {
            continue;
        }

        try {
            if (cmd == "step") {
                int n = 1;
                iss >> n;
                if (n < 1) n = 1;
                int processed = 0;
                while (processed < n && engine->stepEvent()) {
                    ++processed;
                }
                std::cout << engineToJson(*engine) << "\n";
                std::cout.flush();

            } else if (cmd == "run") {
                double duration = 0.0;
                double logEvery = 0.0;
                iss >> duration >> logEvery;
                if (duration <= 0.0) {
                    std::cerr << "Usage: run T log\n";
                    continue;
                }
                if (logEvery <= 0.0) logEvery = duration;

                bool isNewFile = !std::filesystem::exists("metrics.csv");
                std::ofstream metricsFile("metrics.csv", std::ios::app);
                if (isNewFile) {
                    logMetricsHeader(cfg.tasks, metricsFile);
                }

                const double end = engine->time() + duration;
                while (!engine->finished() && engine->time() < end) {
                    engine->runUntil(std::min(end, engine->time() + logEvery));
                    logMetrics(*engine, metricsFile);

                    auto m = engine->computeMetrics();
                    std::cerr << "t=" << std::fixed << std::setprecision(1) << m.time << "\r";
                    std::cerr.flush();
                    std::cout << "t=" << std::setprecision(1) << m.time << ": "
                              << "Active=" << m.active << ", "
                              << "Switches=" << m.switches << ", "
                              << "Var=" << std::setprecision(4) << m.populationVariance << ", "
                              << "Gap=" << std::setprecision(3) << m.payoffGap << ", "
                              << "Balance=" << m.balance << "\n";
                    std::cout.flush();
                }

                std::cerr << "\n";
                metricsFile.close();
                std::cout << "Now at t=" << engine->time() << " (" << engineStateName(engine->state())
                          << "). Metrics appended to metrics.csv\n";
                std::cout.flush();

            } else if (cmd == "finish") {
                engine->runUntil(cfg.horizon);
                std::cout << engineToJson(*engine) << "\n";
                std::cout.flush();

            } else if (cmd == "state") {
                std::string opt;
                iss >> opt;
                std::cout << engineToJson(*engine, opt == "agents") << "\n";
                std::cout.flush();

            } else if (cmd == "metrics") {
                printMetrics(*engine);

            } else if (cmd == "equilibrium") {
                const auto x = engine->population().fractions();
                std::cout << std::fixed << std::setprecision(3);
                for (std::uint32_t i = 0; i < cfg.tasks; ++i) {
                    auto level = engine->dynamics().equilibriumLevel(i, x[i]);
                    std::cout << "  task " << i << ": x=" << x[i] << "  q*=";
                    if (level) {
                        std::cout << *level << "\n";
                    } else {
                        std::cout << "unreachable\n";
                    }
                }
                std::cout.flush();

            } else if (cmd == "fail") {
                std::uint32_t k = 0;
                if (!(iss >> k)) {
                    std::cerr << "Usage: fail K\n";
                    continue;
                }
                engine->failAgent(k);
                std::cout << "Agent " << k << " failed; " << engine->population().active()
                          << " active\n";
                std::cout.flush();

            } else if (cmd == "growth") {
                std::uint32_t task = 0;
                double w = 0.0;
                if (!(iss >> task >> w)) {
                    std::cerr << "Usage: growth T W\n";
                    continue;
                }
                engine->setGrowthRate(task, w);
                std::cout << "Task " << task << " growth rate set to " << w << "\n";
                std::cout.flush();

            } else if (cmd == "events") {
                std::size_t n = 20;
                iss >> n;
                const auto& events = engine->eventLog().events();
                const std::size_t first = events.size() > n ? events.size() - n : 0;
                std::cout << std::setprecision(3);
                for (std::size_t i = first; i < events.size(); ++i) {
                    const auto& e = events[i];
                    std::cout << e.time << "," << eventTypeName(e.type) << "," << e.agent << ","
                              << e.from << "," << e.to << "," << e.value << "\n";
                }
                std::cout << "(" << engine->eventLog().total(EventType::Reassignment)
                          << " reassignments, " << engine->eventLog().total(EventType::AgentFailure)
                          << " failures, " << engine->eventLog().dropped() << " dropped)\n";
                std::cout.flush();

            } else if (cmd == "ensemble") {
                std::uint32_t replicates = 8;
                iss >> replicates;
                replicates = std::clamp<std::uint32_t>(replicates, 1, 1024);
                std::cerr << "Running " << replicates << " replicates...\n";
                Ensemble ensemble(cfg);
                const auto results = ensemble.run(replicates);
                const auto summary = Ensemble::summarize(results);
                std::cout << std::fixed << std::setprecision(3);
                std::cout << "\n=== Ensemble (" << replicates << " replicates) ===\n";
                for (std::size_t i = 0; i < summary.meanX.size(); ++i) {
                    std::cout << "  task " << i << ": mean x=" << summary.meanX[i]
                              << "  mean q=" << summary.meanQ[i] << "\n";
                }
                std::cout << "Mean switches: " << summary.meanSwitches << "\n";
                std::cout << "Mean balance: " << summary.meanBalance << "\n";
                std::cout << "Converged: " << summary.converged << "/" << replicates << "\n\n";
                std::cout.flush();

            } else if (cmd == "reset") {
                std::string name;
                if (iss >> name) {
                    cfg = resolveConfig(name, overrides);
                    preset = name;
                }
                engine = std::make_unique<Engine>(cfg);
                engine->start();
                std::cout << "Reset: " << cfg.agents << " agents, " << cfg.tasks << " tasks (preset="
                          << canonicalPresetName(preset) << ")\n";
                std::cout.flush();

            } else if (cmd == "quit") {
                break;

            } else if (cmd == "help") {
                printHelp();

            } else {
                std::cerr << "Unknown command: " << cmd << "\n";
                printHelp();
            }
        } catch (const std::exception& e) {
            std::cerr << "Error in " << cmd << " command: " << e.what() << "\n";
        }
    }

    return 0;
}
