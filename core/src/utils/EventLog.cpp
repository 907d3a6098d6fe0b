#include "utils/EventLog.h"

#include <ostream>

const char* eventTypeName(EventType type) {
    switch (type) {
        case EventType::Reassignment: return "reassign";
        case EventType::AgentFailure: return "failure";
        case EventType::GrowthChange: return "growth";
        case EventType::StateChange:  return "state";
        default: return "unknown";
    }
}

EventLog::EventLog(std::size_t capacity) : capacity_(capacity) {}

void EventLog::logReassignment(double time, std::uint32_t agent, std::uint32_t from, std::uint32_t to) {
    SimEvent e;
    e.type = EventType::Reassignment;
    e.time = time;
    e.agent = agent;
    e.from = static_cast<std::int32_t>(from);
    e.to = static_cast<std::int32_t>(to);
    push(e);
}

void EventLog::logFailure(double time, std::uint32_t agent, std::uint32_t task) {
    SimEvent e;
    e.type = EventType::AgentFailure;
    e.time = time;
    e.agent = agent;
    e.from = static_cast<std::int32_t>(task);
    push(e);
}

void EventLog::logGrowthChange(double time, std::uint32_t task, double previous, double rate) {
    SimEvent e;
    e.type = EventType::GrowthChange;
    e.time = time;
    e.to = static_cast<std::int32_t>(task);
    e.previous = previous;
    e.value = rate;
    push(e);
}

void EventLog::logStateChange(double time, int from, int to) {
    SimEvent e;
    e.type = EventType::StateChange;
    e.time = time;
    e.from = from;
    e.to = to;
    push(e);
}

void EventLog::clear() {
    events_.clear();
    dropped_ = 0;
    for (auto& t : totals_) t = 0;
}

std::vector<SimEvent> EventLog::eventsOfType(EventType type) const {
    std::vector<SimEvent> out;
    for (const auto& e : events_) {
        if (e.type == type) out.push_back(e);
    }
    return out;
}

std::uint64_t EventLog::total(EventType type) const {
    return totals_[static_cast<std::size_t>(type)];
}

void EventLog::writeCsv(std::ostream& out) const {
    for (const auto& e : events_) {
        out << e.time << "," << eventTypeName(e.type) << "," << e.agent << ","
            << e.from << "," << e.to << "," << e.value << "\n";
    }
}

void EventLog::push(const SimEvent& event) {
    totals_[static_cast<std::size_t>(event.type)]++;
    if (capacity_ == 0) {
        ++dropped_;
        return;
    }
    if (events_.size() >= capacity_) {
        events_.pop_front();
        ++dropped_;
    }
    events_.push_back(event);
}
