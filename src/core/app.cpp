#include "app.hpp"

#include "core/log.hpp"
#include "core/profile.hpp"
#include "platform/glfw_surface.hpp"
#include "platform/window.hpp"
#include "render/gpu_context.hpp"
#include "render/vk_api.hpp"

#include <cstdio>
#include <string>

namespace kindle {

int App::run(int argc, const char* const* argv) {
    std::string arg_error;
    if (!parse_args(argc, argv, config, arg_error)) {
        std::fprintf(stderr, "kindle: %s\n", arg_error.c_str());
        print_usage(argc > 0 ? argv[0] : nullptr);
        return 2;
    }
    if (config.show_help) {
        print_usage(argc > 0 ? argv[0] : nullptr);
        return 0;
    }

    log::Config log_cfg{};
    log_cfg.file_path = config.log_path;
    log::init(log_cfg);
    LOG_INFO("Core", "Startup");

    platform::Window window;
    if (!window.create(config.window)) {
        std::fprintf(stderr, "kindle: failed to create window\n");
        log::shutdown();
        return 1;
    }
    LOG_INFO("Core", "Window initialized");

    render::VulkanInstanceOps instance_ops;
    render::VulkanDeviceOps device_ops;
    platform::GlfwSurfaceOps surface_ops;
    render::GpuContext context(render::VulkanApi{instance_ops, device_ops, surface_ops});
    if (!context.init(config.app, config.validation, window.handle())) {
        std::fprintf(stderr, "kindle: %s\n", render::describe(context.error()).c_str());
        window.destroy();
        log::shutdown();
        return 1;
    }
    LOG_INFO("Core", "Vulkan initialized");

    gpu = &context;
    run_event_loop(window, *this);
    gpu = nullptr;

    window.destroy();
    LOG_INFO("Core", "Shutdown");
    log::shutdown();
    return 0;
}

void App::on_redraw() {
    KINDLE_PROFILE_SCOPE_N("frame");
    render();
}

void App::on_close() {
    if (gpu) gpu->destroy();
}

// Swapchain and frame submission consume gpu->device() and gpu->graphics_queue() here.
void App::render() {}

}
