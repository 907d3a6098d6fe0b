#ifndef EVENT_LOG_H
#define EVENT_LOG_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iosfwd>
#include <string>
#include <vector>

enum class EventType : std::uint8_t {
    Reassignment = 0,   // agent switched task
    AgentFailure = 1,   // agent removed from the live population
    GrowthChange = 2,   // task growth rate w_i changed
    StateChange = 3,    // engine lifecycle transition
    COUNT
};

const char* eventTypeName(EventType type);

struct SimEvent {
    EventType type = EventType::Reassignment;
    double time = 0.0;
    std::int64_t agent = -1;   // -1 when not agent-specific
    std::int32_t from = -1;    // task, or previous engine state
    std::int32_t to = -1;      // task, or next engine state
    double value = 0.0;        // growth rate for GrowthChange
    double previous = 0.0;

    bool operator==(const SimEvent& other) const {
        return type == other.type && time == other.time && agent == other.agent &&
               from == other.from && to == other.to && value == other.value &&
               previous == other.previous;
    }
};

/**
 * Bounded in-memory trace of discrete simulation events.
 *
 * Oldest entries are dropped once capacity is reached; per-type totals keep
 * counting so long runs still report accurate event counts.
 */
class EventLog {
public:
    explicit EventLog(std::size_t capacity = 1000000);

    void logReassignment(double time, std::uint32_t agent, std::uint32_t from, std::uint32_t to);
    void logFailure(double time, std::uint32_t agent, std::uint32_t task);
    void logGrowthChange(double time, std::uint32_t task, double previous, double rate);
    void logStateChange(double time, int from, int to);

    void clear();

    const std::deque<SimEvent>& events() const { return events_; }
    std::vector<SimEvent> eventsOfType(EventType type) const;
    std::uint64_t total(EventType type) const;
    std::size_t capacity() const { return capacity_; }
    std::size_t dropped() const { return dropped_; }

    // One line per event: time,type,agent,from,to,value
    void writeCsv(std::ostream& out) const;

private:
    void push(const SimEvent& event);

    std::deque<SimEvent> events_;
    std::size_t capacity_;
    std::size_t dropped_ = 0;
    std::uint64_t totals_[static_cast<std::size_t>(EventType::COUNT)] = {0, 0, 0, 0};
};

#endif
