#pragma once

#include <cstdint>

namespace kindle {

enum class Event : unsigned char { CloseRequested, MainEventsCleared, RedrawRequested };

class EventSource {
public:
    virtual ~EventSource() = default;

    // Collect pending OS events into the queue.
    virtual void pump() = 0;
    // Pops one queued event; false when the queue is empty.
    virtual bool next(Event& out) = 0;
    virtual void request_redraw() = 0;
};

class LoopHandler {
public:
    virtual ~LoopHandler() = default;

    virtual void on_redraw() = 0;
    virtual void on_close() = 0;
};

// Single-threaded; dispatches at most one event per iteration and stops after
// the iteration that handled CloseRequested. Returns the iteration count.
std::uint64_t run_event_loop(EventSource& source, LoopHandler& handler);

}
