#pragma once

#include "events/Event.hpp"
#include <deque>

namespace whichkey::events {

// FIFO of pending events. Single-threaded: only the event loop touches it.
class EventQueue {
public:
    void push(const Event& event);
    Event pop();

    bool empty() const { return events_.empty(); }
    size_t size() const { return events_.size(); }

private:
    std::deque<Event> events_;
};

}  // namespace whichkey::events
