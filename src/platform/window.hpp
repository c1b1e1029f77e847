#pragma once

#include <deque>

#include "core/config.hpp"
#include "core/event_loop.hpp"

struct GLFWwindow;

namespace kindle::platform {

// GLFW window without a client API; feeds the event loop.
class Window final : public EventSource {
public:
    Window() = default;
    ~Window() override;

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool create(const WindowConfig& cfg);
    void destroy();

    GLFWwindow* handle() const { return window_; }

    void pump() override;
    bool next(Event& out) override;
    void request_redraw() override;

private:
    static void close_callback(GLFWwindow* window);

    GLFWwindow* window_{};
    bool glfw_ready_{false};
    bool redraw_pending_{false};
    std::deque<Event> queue_;
};

}
