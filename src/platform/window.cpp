#include "window.hpp"

#include "core/log.hpp"

#include <GLFW/glfw3.h>

namespace kindle::platform {

Window::~Window() {
    destroy();
}

bool Window::create(const WindowConfig& cfg) {
    glfwSetErrorCallback([](int code, const char* desc) {
        LOG_ERROR("Window", "GLFW error %d: %s", code, desc ? desc : "");
    });
    if (!glfwInit()) return false;
    glfw_ready_ = true;
    if (!glfwVulkanSupported()) {
        LOG_ERROR("Window", "GLFW found no Vulkan loader");
        return false;
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    window_ = glfwCreateWindow(static_cast<int>(cfg.width), static_cast<int>(cfg.height), cfg.title.c_str(), nullptr, nullptr);
    if (!window_) return false;
    glfwSetWindowUserPointer(window_, this);
    glfwSetWindowCloseCallback(window_, close_callback);
    LOG_INFO("Window", "created %ux%u '%s'", cfg.width, cfg.height, cfg.title.c_str());
    return true;
}

void Window::destroy() {
    if (window_) glfwDestroyWindow(window_);
    window_ = nullptr;
    if (glfw_ready_) glfwTerminate();
    glfw_ready_ = false;
    queue_.clear();
}

void Window::close_callback(GLFWwindow* window) {
    auto* self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    if (self) self->queue_.push_back(Event::CloseRequested);
}

void Window::pump() {
    if (!queue_.empty() || !window_) return;
    glfwPollEvents();
    if (redraw_pending_) {
        redraw_pending_ = false;
        queue_.push_back(Event::RedrawRequested);
    }
    queue_.push_back(Event::MainEventsCleared);
}

bool Window::next(Event& out) {
    if (queue_.empty()) return false;
    out = queue_.front();
    queue_.pop_front();
    return true;
}

void Window::request_redraw() {
    redraw_pending_ = true;
}

}
