#include "events/Timer.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <format>
#include <sys/timerfd.h>
#include <system_error>
#include <unistd.h>

namespace whichkey::events {

namespace {

timespec to_timespec(std::chrono::milliseconds ms) {
    timespec ts{};
    ts.tv_sec = static_cast<time_t>(ms.count() / 1000);
    ts.tv_nsec = static_cast<long>((ms.count() % 1000) * 1000000);
    return ts;
}

}  // namespace

Timer::Timer() {
    fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "timerfd_create");
    }
}

Timer::~Timer() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

void Timer::arm(std::chrono::milliseconds delay, std::chrono::milliseconds interval) {
    // An all-zero it_value would disarm instead
    if (delay.count() <= 0) {
        delay = std::chrono::milliseconds(1);
    }

    itimerspec spec{};
    spec.it_value = to_timespec(delay);
    spec.it_interval = to_timespec(interval);
    if (timerfd_settime(fd_, 0, &spec, nullptr) < 0) {
        throw std::system_error(errno, std::generic_category(), "timerfd_settime");
    }
    armed_ = true;
    periodic_ = interval.count() > 0;
}

void Timer::disarm() {
    itimerspec spec{};
    if (timerfd_settime(fd_, 0, &spec, nullptr) < 0) {
        util::Logger::warn(std::format("Timer: Failed to disarm: errno={}", errno));
    }
    armed_ = false;
    periodic_ = false;
}

uint64_t Timer::consume() {
    uint64_t expirations = 0;
    ssize_t n;
    do {
        n = read(fd_, &expirations, sizeof(expirations));
    } while (n < 0 && errno == EINTR);

    if (n != static_cast<ssize_t>(sizeof(expirations))) {
        return 0;  // spurious wake-up, nothing expired
    }
    if (!periodic_) {
        armed_ = false;
    }
    return expirations;
}

}  // namespace whichkey::events
