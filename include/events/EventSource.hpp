#pragma once

#include "events/EventQueue.hpp"

namespace whichkey::events {

/**
 * A pollable producer of events (the compositor connection). Follows the
 * prepare/read/cancel protocol of libwayland so that no queued event is
 * ever left behind while the loop blocks.
 */
class EventSource {
public:
    virtual ~EventSource() = default;

    virtual int fd() const = 0;

    // Dispatch already-read data, appending the resulting events
    virtual void dispatch_pending(EventQueue& out) = 0;

    // Returns false when events became available and the loop must not block.
    // After true, exactly one of read_events() or cancel_read() follows.
    virtual bool prepare_read(EventQueue& out) = 0;
    virtual void read_events(EventQueue& out) = 0;
    virtual void cancel_read() = 0;
};

}  // namespace whichkey::events
