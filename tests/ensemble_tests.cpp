#include <gtest/gtest.h>
#include "modules/Ensemble.h"
#include "io/Snapshot.h"
#include <algorithm>
#include <numeric>
#include <sstream>

namespace {
    EngineConfig replicateConfig() {
        EngineConfig cfg;
        cfg.assignment = InitialAssignment::SingleTask;
        cfg.horizon = 200.0;
        cfg.seed = 2718;
        return cfg;
    }
}

// Replicate 0 reproduces a standalone run with the base seed
TEST(EnsembleTest, ReplicateMatchesStandaloneRun) {
    EngineConfig cfg = replicateConfig();
    Ensemble ensemble(cfg);
    auto results = ensemble.run(3);
    ASSERT_EQ(results.size(), 3u);

    Engine engine(cfg);
    engine.run();
    EXPECT_EQ(results[0].seed, cfg.seed);
    EXPECT_EQ(results[0].x, engine.population().fractions());
    EXPECT_EQ(results[0].q, engine.population().resources());
    EXPECT_EQ(results[0].switches, engine.switches());
    EXPECT_EQ(results[0].revisions, engine.revisions());
    EXPECT_EQ(results[0].reason, TerminationReason::Horizon);
}

TEST(EnsembleTest, DeterministicUnderParallelSchedule) {
    Ensemble ensemble(replicateConfig());
    auto first = ensemble.run(6);
    auto second = ensemble.run(6);
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t r = 0; r < first.size(); ++r) {
        EXPECT_EQ(first[r].seed, second[r].seed);
        EXPECT_EQ(first[r].x, second[r].x);
        EXPECT_EQ(first[r].switches, second[r].switches);
        EXPECT_DOUBLE_EQ(first[r].endTime, 200.0);
    }
    EXPECT_NE(first[1].seed, first[2].seed);
}

TEST(EnsembleTest, SummaryAverages) {
    Ensemble ensemble(replicateConfig());
    auto results = ensemble.run(4);
    auto summary = Ensemble::summarize(results);

    ASSERT_EQ(summary.meanX.size(), 4u);
    EXPECT_NEAR(std::accumulate(summary.meanX.begin(), summary.meanX.end(), 0.0), 1.0, 1e-12);
    double switches = 0.0;
    for (const auto& r : results) switches += static_cast<double>(r.switches);
    EXPECT_NEAR(summary.meanSwitches, switches / 4.0, 1e-9);
    EXPECT_EQ(summary.converged, 0u);

    EXPECT_TRUE(Ensemble::summarize({}).meanX.empty());
}

TEST(EnsembleTest, InvalidBaseConfig) {
    EngineConfig cfg = replicateConfig();
    cfg.revisionRate = -1.0;
    EXPECT_THROW(Ensemble ensemble(cfg), std::invalid_argument);
}

// ---------- Snapshot export ----------

TEST(SnapshotTest, JsonAndCsvExport) {
    EngineConfig cfg = replicateConfig();
    cfg.agents = 3;
    Engine engine(cfg);
    engine.run();

    const std::string json = engineToJson(engine, true);
    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_NE(json.find("\"state\":\"terminated\""), std::string::npos);
    EXPECT_NE(json.find("\"termination\":\"horizon\""), std::string::npos);
    EXPECT_NE(json.find("\"agents\":["), std::string::npos);
    EXPECT_NE(json.find("\"id\":2"), std::string::npos);

    std::ostringstream csv;
    logMetricsHeader(cfg.tasks, csv);
    logMetrics(engine, csv);
    const std::string text = csv.str();
    EXPECT_EQ(text.rfind("time,active,revisions,switches,q0", 0), 0u);
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 2);

    // Header and row carry the same number of columns
    const auto headerEnd = text.find('\n');
    const std::string header = text.substr(0, headerEnd);
    const std::string row = text.substr(headerEnd + 1);
    EXPECT_EQ(std::count(header.begin(), header.end(), ','), std::count(row.begin(), row.end(), ','));
}
