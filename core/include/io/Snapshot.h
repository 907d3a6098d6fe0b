#ifndef ENGINE_SNAPSHOT_H
#define ENGINE_SNAPSHOT_H

#include "kernel/Engine.h"
#include <string>
#include <iosfwd>

// JSON export for engine state
std::string engineToJson(const Engine& engine, bool includeAgents = false);

// CSV metrics logging: one header line, then one row per call
void logMetricsHeader(std::uint32_t tasks, std::ostream& out);
void logMetrics(const Engine& engine, std::ostream& out);

#endif
