#include "events/EventQueue.hpp"
#include "util/Logger.hpp"
#include <format>
#include <stdexcept>

namespace whichkey::events {

const char* to_string(Event::Type type) {
    switch (type) {
        case Event::Type::Configure:     return "Configure";
        case Event::Type::FrameDone:     return "FrameDone";
        case Event::Type::ScaleChanged:  return "ScaleChanged";
        case Event::Type::SurfaceClosed: return "SurfaceClosed";
        case Event::Type::KeyboardEnter: return "KeyboardEnter";
        case Event::Type::KeyboardLeave: return "KeyboardLeave";
        case Event::Type::Key:           return "Key";
        case Event::Type::RepeatInfo:    return "RepeatInfo";
        case Event::Type::IdleTimeout:   return "IdleTimeout";
        case Event::Type::RepeatTick:    return "RepeatTick";
        case Event::Type::Signal:        return "Signal";
    }
    return "?";
}

void EventQueue::push(const Event& event) {
    util::Logger::debug(std::format("EventQueue: Queued {}", to_string(event.type)));
    events_.push_back(event);
}

Event EventQueue::pop() {
    if (events_.empty()) {
        throw std::logic_error("EventQueue: pop from empty queue");
    }
    Event event = events_.front();
    events_.pop_front();
    return event;
}

}  // namespace whichkey::events
