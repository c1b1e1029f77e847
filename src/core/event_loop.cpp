#include "event_loop.hpp"

#include "core/log.hpp"
#include "core/profile.hpp"

namespace kindle {

std::uint64_t run_event_loop(EventSource& source, LoopHandler& handler) {
    std::uint64_t iterations = 0;
    bool exit = false;
    while (!exit) {
        KINDLE_PROFILE_SCOPE_N("loop");
        ++iterations;
        source.pump();

        Event ev{};
        if (!source.next(ev)) continue;
        switch (ev) {
            case Event::CloseRequested:
                LOG_INFO("Core", "close requested, stopping");
                handler.on_close();
                exit = true;
                break;
            case Event::MainEventsCleared:
                source.request_redraw();
                break;
            case Event::RedrawRequested:
                handler.on_redraw();
                break;
        }
    }
    return iterations;
}

}
