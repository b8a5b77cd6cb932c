#pragma once

#include <chrono>
#include <cstdint>

namespace whichkey::events {

/**
 * One-shot or periodic monotonic timer backed by a timerfd, so that it can
 * be waited on together with the compositor connection.
 */
class Timer {
public:
    Timer();
    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    // interval of zero makes it one-shot
    void arm(std::chrono::milliseconds delay, std::chrono::milliseconds interval = std::chrono::milliseconds(0));
    void disarm();

    bool armed() const { return armed_; }
    int fd() const { return fd_; }

    // Reads the expiration count after the fd polled readable
    uint64_t consume();

private:
    int fd_ = -1;
    bool armed_ = false;
    bool periodic_ = false;
};

}  // namespace whichkey::events
