#include <gtest/gtest.h>
#include "kernel/Engine.h"
#include "kernel/Presets.h"
#include "modules/Scenario.h"
#include <algorithm>
#include <cmath>
#include <set>

TEST(ScenarioTest, SurgeExpandsToSetAndRestore) {
    ScenarioConfig cfg;
    cfg.surges.push_back(GrowthSurge{});
    cfg.failures.push_back(FailureWave{550.0, 3});

    Scenario scenario;
    scenario.configure(cfg, {0.5, 0.5, 0.5, 0.5}, 1);

    const auto& actions = scenario.actions();
    ASSERT_EQ(actions.size(), 3u);
    EXPECT_DOUBLE_EQ(actions[0].time, 500.0);
    EXPECT_EQ(actions[0].kind, ScenarioActionKind::SetGrowthRate);
    EXPECT_DOUBLE_EQ(actions[0].rate, 5.0);
    EXPECT_DOUBLE_EQ(actions[1].time, 550.0);
    EXPECT_EQ(actions[1].kind, ScenarioActionKind::FailAgents);
    EXPECT_DOUBLE_EQ(actions[2].time, 600.0);
    EXPECT_DOUBLE_EQ(actions[2].rate, 0.5);

    EXPECT_DOUBLE_EQ(scenario.nextTime(), 500.0);
    scenario.popNext();
    scenario.popNext();
    scenario.popNext();
    EXPECT_FALSE(scenario.hasPending());
    EXPECT_THROW(scenario.popNext(), std::logic_error);
}

TEST(ScenarioTest, InvalidSurges) {
    Scenario scenario;
    ScenarioConfig cfg;
    GrowthSurge surge;
    surge.task = 4;
    cfg.surges = {surge};
    EXPECT_THROW(scenario.configure(cfg, {0.5, 0.5, 0.5, 0.5}, 1), std::invalid_argument);

    surge.task = 0;
    surge.end = surge.start;
    cfg.surges = {surge};
    EXPECT_THROW(scenario.configure(cfg, {0.5, 0.5, 0.5, 0.5}, 1), std::invalid_argument);
}

TEST(ScenarioTest, FailurePickIsDistinctSubset) {
    Scenario scenario;
    scenario.configure(ScenarioConfig{}, {0.5}, 77);

    std::vector<std::uint32_t> live = {1, 3, 4, 8, 9, 12, 20};
    auto picked = scenario.pickFailures(live, 4);
    ASSERT_EQ(picked.size(), 4u);
    EXPECT_TRUE(std::is_sorted(picked.begin(), picked.end()));
    std::set<std::uint32_t> unique(picked.begin(), picked.end());
    EXPECT_EQ(unique.size(), 4u);
    for (auto k : picked) {
        EXPECT_NE(std::find(live.begin(), live.end(), k), live.end());
    }

    EXPECT_EQ(scenario.pickFailures(live, 50), live);
}

// The growth surge is active exactly on its window
TEST(ScenarioTest, GrowthSurgeWindow) {
    EngineConfig cfg = presetConfig("surge");
    cfg.horizon = 700.0;
    Engine engine(cfg);

    engine.setTickObserver([](const Engine& e) {
        // Ticks sharing a timestamp with an action run before it
        const double t = e.time();
        if (std::abs(t - 500.0) < 1e-6 || std::abs(t - 600.0) < 1e-6) return;
        const double w0 = e.dynamics().growthRate(0);
        if (t < 500.0 || t > 600.0) {
            EXPECT_DOUBLE_EQ(w0, 0.5) << "t=" << e.time();
        } else {
            EXPECT_DOUBLE_EQ(w0, 5.0) << "t=" << e.time();
        }
    });
    engine.run();

    auto changes = engine.eventLog().eventsOfType(EventType::GrowthChange);
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_DOUBLE_EQ(changes[0].time, 500.0);
    EXPECT_DOUBLE_EQ(changes[0].value, 5.0);
    EXPECT_DOUBLE_EQ(changes[1].time, 600.0);
    EXPECT_DOUBLE_EQ(changes[1].value, 0.5);
    EXPECT_DOUBLE_EQ(engine.dynamics().growthRate(0), 0.5);
}

// A surge pulls agents towards the boosted task
TEST(ScenarioTest, SurgeAttractsAgents) {
    EngineConfig cfg = presetConfig("surge");
    cfg.horizon = 600.0;
    Engine engine(cfg);
    engine.start();
    engine.runUntil(499.0);
    const auto before = engine.population().counts()[0];
    engine.run();
    EXPECT_GT(engine.population().counts()[0], before);
}

TEST(ScenarioTest, FailureWaveRemovesAgents) {
    EngineConfig cfg = presetConfig("failures");
    cfg.horizon = 600.0;
    Engine engine(cfg);
    std::uint64_t afterWave = 0;
    engine.setDirectiveSink([&](const Directive& d) {
        if (d.time > 500.0) {
            ++afterWave;
            EXPECT_TRUE(engine.population().isAlive(d.agent));
        }
    });
    engine.run();

    EXPECT_EQ(engine.population().active(), 25u);
    EXPECT_EQ(engine.eventLog().total(EventType::AgentFailure), 15u);
    EXPECT_GT(afterWave, 0u);
    for (const auto& e : engine.eventLog().eventsOfType(EventType::AgentFailure)) {
        EXPECT_DOUBLE_EQ(e.time, 500.0);
    }
}

TEST(ScenarioTest, FailureWaveLargerThanPopulation) {
    EngineConfig cfg;
    cfg.agents = 10;
    cfg.scenario.failures.push_back(FailureWave{20.0, 50});
    Engine engine(cfg);
    engine.run();

    EXPECT_EQ(engine.terminationReason(), TerminationReason::Extinct);
    EXPECT_EQ(engine.population().active(), 0u);
    EXPECT_DOUBLE_EQ(engine.time(), 20.0);
}

// ---------- Presets ----------

TEST(PresetTest, NamedPresets) {
    EngineConfig base = presetConfig("baseline");
    EXPECT_EQ(base.agents, 40u);
    EXPECT_EQ(base.tasks, 4u);
    EXPECT_DOUBLE_EQ(base.nu, 0.0);
    EXPECT_TRUE(base.scenario.surges.empty());

    EXPECT_EQ(presetConfig("Surge").scenario.surges.size(), 1u);
    EXPECT_EQ(presetConfig("failures").scenario.failures.size(), 1u);
    EXPECT_EQ(canonicalPresetName("Model-Based"), "modelbased");
    EXPECT_EQ(canonicalPresetName(""), "baseline");
    EXPECT_EQ(canonicalPresetName("nope"), "");
    EXPECT_THROW(presetConfig("nope"), std::invalid_argument);
    EXPECT_EQ(presetNames().size(), 4u);
}

TEST(PresetTest, OverridesSurvivePresetChoice) {
    EngineConfig cfg = resolveConfig("surge", {"--agents=12", "--nu=2.5", "--horizon=300", "--seed=9"});
    EXPECT_EQ(cfg.agents, 12u);
    EXPECT_DOUBLE_EQ(cfg.nu, 2.5);
    EXPECT_DOUBLE_EQ(cfg.horizon, 300.0);
    EXPECT_EQ(cfg.seed, 9u);
    EXPECT_EQ(cfg.scenario.surges.size(), 1u);

    // Later overrides win over earlier ones
    EXPECT_EQ(resolveConfig("baseline", {"--agents=12", "--agents=20"}).agents, 20u);

    EXPECT_THROW(resolveConfig("baseline", {"--tasks=3"}), std::invalid_argument);
    EXPECT_THROW(resolveConfig("nope", {}), std::invalid_argument);

    EngineConfig scratch;
    EXPECT_FALSE(applyConfigOverride("--preset=surge", scratch));
    EXPECT_TRUE(applyConfigOverride("--nu=1", scratch));
    EXPECT_THROW(applyConfigOverride("--agents=many", scratch), std::invalid_argument);
}

TEST(PresetTest, ModelBasedReferenceLevel) {
    EngineConfig cfg = presetConfig("model-based");
    EXPECT_DOUBLE_EQ(cfg.nu, 40.0);

    Engine engine(cfg);
    // gamma* sits at the symmetric equilibrium, so the correction vanishes there
    EXPECT_NEAR(engine.dynamics().consumption(0, cfg.referenceLevel, 0.25), 0.5, 1e-9);
    for (double p : engine.currentPayoffs()) {
        EXPECT_NEAR(p, 0.0, 1e-6);
    }
}
