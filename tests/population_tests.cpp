#include <gtest/gtest.h>
#include "kernel/PopulationState.h"
#include "kernel/EventQueue.h"
#include "modules/ResourceDynamics.h"
#include "utils/EventLog.h"
#include <numeric>
#include <random>
#include <sstream>
#include <thread>

namespace {
    std::vector<std::uint32_t> roundRobin(std::uint32_t agents, std::uint32_t tasks) {
        std::vector<std::uint32_t> out(agents);
        for (std::uint32_t k = 0; k < agents; ++k) out[k] = k % tasks;
        return out;
    }

    double sum(const std::vector<double>& v) {
        return std::accumulate(v.begin(), v.end(), 0.0);
    }
}

TEST(PopulationTest, SharesFromCounts) {
    PopulationState pop;
    pop.configure(4, roundRobin(40, 4), std::vector<double>(4, 0.0));

    EXPECT_EQ(pop.active(), 40u);
    EXPECT_EQ(pop.numAgents(), 40u);
    EXPECT_EQ(pop.numTasks(), 4u);
    for (double x : pop.fractions()) {
        EXPECT_DOUBLE_EQ(x, 0.25);
    }
}

TEST(PopulationTest, TaskChangeUpdatesShares) {
    PopulationState pop;
    pop.configure(2, std::vector<std::uint32_t>(10, 0), {0.0, 0.0});

    EXPECT_FALSE(pop.applyTaskChange(3, 0));
    EXPECT_TRUE(pop.applyTaskChange(3, 1));
    EXPECT_EQ(pop.taskOf(3), 1u);

    auto x = pop.fractions();
    EXPECT_DOUBLE_EQ(x[0], 0.9);
    EXPECT_DOUBLE_EQ(x[1], 0.1);
    EXPECT_NEAR(sum(x), 1.0, 1e-12);

    EXPECT_THROW(pop.applyTaskChange(10, 0), std::out_of_range);
    EXPECT_THROW(pop.applyTaskChange(0, 2), std::out_of_range);
}

TEST(PopulationTest, RemovalRenormalizesShares) {
    PopulationState pop;
    pop.configure(4, roundRobin(8, 4), std::vector<double>(4, 0.0));

    EXPECT_TRUE(pop.removeAgent(0));
    EXPECT_TRUE(pop.removeAgent(4));
    EXPECT_FALSE(pop.removeAgent(4));
    EXPECT_FALSE(pop.isAlive(0));
    EXPECT_EQ(pop.active(), 6u);

    auto x = pop.fractions();
    EXPECT_DOUBLE_EQ(x[0], 0.0);
    EXPECT_NEAR(x[1], 2.0 / 6.0, 1e-15);
    EXPECT_NEAR(sum(x), 1.0, 1e-12);

    // A failed agent cannot be reassigned and its confirmations are ignored
    EXPECT_THROW(pop.applyTaskChange(0, 1), std::out_of_range);
    EXPECT_FALSE(pop.confirmTask(0, 1));
}

TEST(PopulationTest, EmptyPopulationHasZeroShares) {
    PopulationState pop;
    pop.configure(3, roundRobin(3, 3), std::vector<double>(3, 1.0));
    for (std::uint32_t k = 0; k < 3; ++k) pop.removeAgent(k);

    EXPECT_EQ(pop.active(), 0u);
    for (double x : pop.fractions()) {
        EXPECT_EQ(x, 0.0);
    }
}

TEST(PopulationTest, ConfirmTaskCorrectsBucket) {
    PopulationState pop;
    pop.configure(2, {0, 0, 1}, {0.0, 0.0});

    EXPECT_FALSE(pop.confirmTask(2, 1));
    EXPECT_TRUE(pop.confirmTask(0, 1));
    auto counts = pop.counts();
    EXPECT_EQ(counts[0], 1u);
    EXPECT_EQ(counts[1], 2u);
}

TEST(PopulationTest, IntegrationAdvancesResourceTime) {
    ResourceDynamics dynamics;
    dynamics.configure(std::vector<TaskParams>(2, TaskParams{}), 0.05);

    PopulationState pop;
    pop.configure(2, std::vector<std::uint32_t>(4, 0), {0.0, 0.0});

    pop.applyIntegration(dynamics, 2.0);
    EXPECT_DOUBLE_EQ(pop.time(), 2.0);
    auto q = pop.resources();
    EXPECT_NEAR(q[1], 1.0, 1e-9);  // unserved: q = w t
    EXPECT_LT(q[0], 1.0);

    // Going backwards is a no-op
    pop.applyIntegration(dynamics, 1.0);
    EXPECT_DOUBLE_EQ(pop.time(), 2.0);
    EXPECT_EQ(pop.resources(), q);

    auto snap = pop.snapshot();
    EXPECT_DOUBLE_EQ(snap.time, 2.0);
    EXPECT_EQ(snap.q, q);
    EXPECT_EQ(snap.active, 4u);
}

TEST(PopulationTest, InvalidInitialTask) {
    PopulationState pop;
    EXPECT_THROW(pop.configure(2, {0, 2}, {0.0, 0.0}), std::invalid_argument);
    EXPECT_THROW(pop.configure(2, {0, 1}, {0.0}), std::invalid_argument);
}

TEST(PopulationTest, TransactionSeesConsistentState) {
    PopulationState pop;
    pop.configure(2, {0, 0, 0, 1}, {5.0, 7.0});

    bool moved = pop.transact([](PopulationState::Transaction& tx) {
        EXPECT_EQ(tx.active(), 4u);
        EXPECT_DOUBLE_EQ(tx.fractions()[0], 0.75);
        EXPECT_DOUBLE_EQ(tx.resources()[1], 7.0);
        return tx.applyTaskChange(0, 1);
    });
    EXPECT_TRUE(moved);
    EXPECT_DOUBLE_EQ(pop.fractions()[1], 0.5);
}

// Concurrent writers on disjoint agents keep counts consistent
TEST(PopulationTest, ConcurrentMutationsPreserveCounts) {
    const std::uint32_t tasks = 4;
    const std::uint32_t perThread = 10;
    const std::uint32_t threads = 4;
    PopulationState pop;
    pop.configure(tasks, roundRobin(perThread * threads, tasks), std::vector<double>(tasks, 0.0));

    std::vector<std::thread> workers;
    for (std::uint32_t t = 0; t < threads; ++t) {
        workers.emplace_back([&pop, t, perThread, tasks]() {
            std::mt19937_64 rng(100 + t);
            std::uniform_int_distribution<std::uint32_t> pickAgent(0, perThread - 1);
            std::uniform_int_distribution<std::uint32_t> pickTask(0, tasks - 1);
            for (int i = 0; i < 2000; ++i) {
                pop.applyTaskChange(t * perThread + pickAgent(rng), pickTask(rng));
                auto x = pop.fractions();
                double s = 0.0;
                for (double v : x) s += v;
                EXPECT_NEAR(s, 1.0, 1e-12);
            }
        });
    }
    for (auto& w : workers) w.join();

    std::vector<std::uint32_t> expected(tasks, 0);
    for (std::uint32_t k = 0; k < perThread * threads; ++k) {
        expected[pop.taskOf(k)]++;
    }
    EXPECT_EQ(pop.counts(), expected);
    EXPECT_EQ(pop.active(), perThread * threads);
}

// ---------- Event queue ----------

TEST(EventQueueTest, PopsInTimeOrderWithAgentTieBreak) {
    EventQueue queue;
    queue.push(2.0, 5);
    queue.push(1.0, 9);
    queue.push(2.0, 1);
    queue.push(0.5, 3);

    EXPECT_EQ(queue.size(), 4u);
    auto e = queue.pop();
    EXPECT_EQ(e.agent, 3u);
    e = queue.pop();
    EXPECT_EQ(e.agent, 9u);
    e = queue.pop();
    EXPECT_EQ(e.agent, 1u);
    EXPECT_DOUBLE_EQ(e.time, 2.0);
    e = queue.pop();
    EXPECT_EQ(e.agent, 5u);
    EXPECT_TRUE(queue.empty());
}

// ---------- Event log ----------

TEST(EventLogTest, BoundedWithRunningTotals) {
    EventLog log(3);
    EXPECT_EQ(log.capacity(), 3u);
    for (std::uint32_t i = 0; i < 5; ++i) {
        log.logReassignment(i, i, 0, 1);
    }
    log.logFailure(6.0, 2, 1);

    EXPECT_EQ(log.events().size(), 3u);
    EXPECT_EQ(log.dropped(), 3u);
    EXPECT_EQ(log.total(EventType::Reassignment), 5u);
    EXPECT_EQ(log.total(EventType::AgentFailure), 1u);
    EXPECT_EQ(log.events().front().agent, 3);
    EXPECT_EQ(log.eventsOfType(EventType::AgentFailure).size(), 1u);

    std::ostringstream csv;
    log.writeCsv(csv);
    EXPECT_NE(csv.str().find("6,failure,2,1,-1,0"), std::string::npos);

    log.clear();
    EXPECT_TRUE(log.events().empty());
    EXPECT_EQ(log.total(EventType::Reassignment), 0u);
}
