#include "kernel/EventQueue.h"

#include <utility>

void EventQueue::push(double time, std::uint32_t agent) {
    heap_.push(RevisionEvent{time, agent});
}

RevisionEvent EventQueue::pop() {
    RevisionEvent e = heap_.top();
    heap_.pop();
    return e;
}

void EventQueue::reserve(std::size_t n) {
    std::vector<RevisionEvent> storage;
    storage.reserve(n);
    heap_ = decltype(heap_)(PendingOrder(), std::move(storage));
}
