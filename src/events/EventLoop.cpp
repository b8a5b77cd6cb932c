#include "events/EventLoop.hpp"
#include "util/Errors.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <format>
#include <poll.h>
#include <sys/signalfd.h>
#include <system_error>
#include <unistd.h>

namespace whichkey::events {

EventLoop::EventLoop(EventSource& source, const std::vector<int>& signals)
    : source_(source) {
    sigemptyset(&blocked_);
    for (int signo : signals) {
        sigaddset(&blocked_, signo);
    }

    if (sigprocmask(SIG_BLOCK, &blocked_, &previous_mask_) < 0) {
        throw std::system_error(errno, std::generic_category(), "sigprocmask");
    }

    signal_fd_ = signalfd(-1, &blocked_, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        int err = errno;
        sigprocmask(SIG_SETMASK, &previous_mask_, nullptr);
        throw std::system_error(err, std::generic_category(), "signalfd");
    }
}

EventLoop::~EventLoop() {
    close(signal_fd_);
    sigprocmask(SIG_SETMASK, &previous_mask_, nullptr);
}

Event EventLoop::next() {
    while (queue_.empty()) {
        source_.dispatch_pending(queue_);
        if (!queue_.empty()) break;
        wait();
    }
    return queue_.pop();
}

void EventLoop::wait() {
    if (!source_.prepare_read(queue_)) {
        return;
    }

    pollfd fds[4] = {
        {source_.fd(), POLLIN, 0},
        {idle_timer_.fd(), POLLIN, 0},
        {repeat_timer_.fd(), POLLIN, 0},
        {signal_fd_, POLLIN, 0},
    };

    int ret = poll(fds, 4, -1);
    if (ret < 0) {
        int err = errno;
        source_.cancel_read();
        if (err == EINTR) {
            util::Logger::debug("EventLoop: Poll interrupted by signal (EINTR), continuing");
            return;
        }
        throw std::system_error(err, std::generic_category(), "poll");
    }

    if (fds[0].revents & POLLIN) {
        source_.read_events(queue_);
    } else {
        source_.cancel_read();
        if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            throw util::ProtocolError("compositor connection closed");
        }
    }

    if ((fds[1].revents & POLLIN) && idle_timer_.consume() > 0) {
        queue_.push(Event{Event::Type::IdleTimeout});
    }
    if ((fds[2].revents & POLLIN) && repeat_timer_.consume() > 0) {
        queue_.push(Event{Event::Type::RepeatTick});
    }

    if (fds[3].revents & POLLIN) {
        signalfd_siginfo info{};
        while (read(signal_fd_, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
            Event event{Event::Type::Signal};
            event.signal = static_cast<int>(info.ssi_signo);
            util::Logger::info(std::format("EventLoop: Received signal {}", event.signal));
            queue_.push(event);
        }
    }
}

}  // namespace whichkey::events
