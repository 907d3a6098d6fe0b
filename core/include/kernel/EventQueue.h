#ifndef EVENT_QUEUE_H
#define EVENT_QUEUE_H

#include <cstddef>
#include <cstdint>
#include <queue>
#include <vector>

struct RevisionEvent {
    double time = 0.0;
    std::uint32_t agent = 0;
};

/**
 * Pending agent revisions ordered by time.
 *
 * Identical timestamps pop in ascending agent index so a fixed seed always
 * yields the same sequence. Each live agent has exactly one pending entry,
 * so the queue never holds more than N events.
 */
class EventQueue {
public:
    void push(double time, std::uint32_t agent);
    const RevisionEvent& top() const { return heap_.top(); }
    RevisionEvent pop();
    bool empty() const { return heap_.empty(); }
    std::size_t size() const { return heap_.size(); }
    void reserve(std::size_t n);

private:
    struct PendingOrder {
        bool operator()(const RevisionEvent& a, const RevisionEvent& b) const {
            // priority_queue is a max-heap, so invert
            if (b.time < a.time) return true;
            if (a.time < b.time) return false;
            return b.agent < a.agent;
        }
    };

    std::priority_queue<RevisionEvent, std::vector<RevisionEvent>, PendingOrder> heap_;
};

#endif
