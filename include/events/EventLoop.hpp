#pragma once

#include "events/EventQueue.hpp"
#include "events/EventSource.hpp"
#include "events/Timer.hpp"
#include <csignal>
#include <vector>

namespace whichkey::events {

/**
 * Single-threaded multiplexer over the event source, the idle and repeat
 * timers and termination signals. Signals listed at construction are
 * blocked and delivered through a signalfd until the loop is destroyed.
 *
 * Events from one wake-up are ordered: compositor events first, then
 * timers, then signals.
 */
class EventLoop {
public:
    EventLoop(EventSource& source, const std::vector<int>& signals);
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Blocks until an event is available. Throws util::ProtocolError when the
    // source fails or hangs up, std::system_error on OS failures.
    Event next();

    Timer& idle_timer() { return idle_timer_; }
    Timer& repeat_timer() { return repeat_timer_; }

private:
    void wait();

    EventSource& source_;
    EventQueue queue_;
    Timer idle_timer_;
    Timer repeat_timer_;
    int signal_fd_ = -1;
    sigset_t blocked_{};
    sigset_t previous_mask_{};
};

}  // namespace whichkey::events
