#include "io/Snapshot.h"
#include <sstream>
#include <iomanip>

namespace {
    template <typename T>
    void writeArray(std::ostream& os, const std::vector<T>& values) {
        os << "[";
        for (std::size_t i = 0; i < values.size(); ++i) {
            os << values[i];
            if (i + 1 < values.size()) os << ",";
        }
        os << "]";
    }
}

std::string engineToJson(const Engine& engine, bool includeAgents) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);

    auto m = engine.computeMetrics();

    os << "{";
    os << "\"time\":" << m.time << ",";
    os << "\"state\":\"" << engineStateName(engine.state()) << "\",";
    os << "\"termination\":\"" << terminationReasonName(engine.terminationReason()) << "\",";
    os << "\"active\":" << m.active << ",";
    os << "\"q\":";
    writeArray(os, m.q);
    os << ",\"x\":";
    writeArray(os, m.x);
    os << ",\"counts\":";
    writeArray(os, m.counts);
    os << ",\"w\":";
    writeArray(os, m.w);
    os << ",\"payoffs\":";
    writeArray(os, m.payoffs);
    os << ",\"metrics\":{";
    os << "\"revisions\":" << m.revisions << ",";
    os << "\"switches\":" << m.switches << ",";
    os << "\"populationVariance\":" << m.populationVariance << ",";
    os << "\"payoffGap\":" << m.payoffGap << ",";
    os << "\"totalResource\":" << m.totalResource << ",";
    os << "\"balance\":" << m.balance;
    os << "}";

    if (includeAgents) {
        os << ",\"agents\":[";
        const std::uint32_t n = engine.config().agents;
        for (std::uint32_t k = 0; k < n; ++k) {
            const Agent a = engine.agent(k);
            os << "{";
            os << "\"id\":" << a.id << ",";
            os << "\"alive\":" << (a.alive ? "true" : "false") << ",";
            os << "\"task\":" << a.task;
            if (a.alive) {
                os << ",\"nextRevision\":" << a.nextRevisionTime;
            }
            os << "}";
            if (k + 1 < n) os << ",";
        }
        os << "]";
    }

    os << "}";
    return os.str();
}

void logMetricsHeader(std::uint32_t tasks, std::ostream& out) {
    out << "time,active,revisions,switches";
    for (std::uint32_t i = 0; i < tasks; ++i) out << ",q" << i;
    for (std::uint32_t i = 0; i < tasks; ++i) out << ",x" << i;
    for (std::uint32_t i = 0; i < tasks; ++i) out << ",w" << i;
    out << ",variance,payoff_gap,total_resource,balance\n";
}

void logMetrics(const Engine& engine, std::ostream& out) {
    auto m = engine.computeMetrics();
    out << m.time << ","
        << m.active << ","
        << m.revisions << ","
        << m.switches;
    for (double q : m.q) out << "," << q;
    for (double x : m.x) out << "," << x;
    for (double w : m.w) out << "," << w;
    out << "," << m.populationVariance
        << "," << m.payoffGap
        << "," << m.totalResource
        << "," << m.balance << "\n";
}
