#pragma once

#include <vulkan/vulkan.h>

#include "core/config.hpp"
#include "render/bootstrap_error.hpp"
#include "render/debug_messenger.hpp"
#include "render/surface.hpp"
#include "render/vk_api.hpp"
#include "render/vk_device.hpp"
#include "render/vk_instance.hpp"

namespace kindle::render {

// Owns every handle of the bootstrap. Handles are acquired once by init and
// released once by destroy, in the order: messenger, device, surface, instance.
class GpuContext {
public:
    // Failed and Destroyed are terminal: handles are never recreated.
    enum class State : unsigned char { Empty, Live, Failed, Destroyed };

    explicit GpuContext(const VulkanApi& api) : api_(api) {}
    ~GpuContext();

    GpuContext(const GpuContext&) = delete;
    GpuContext& operator=(const GpuContext&) = delete;

    // On failure, anything already created is released, the context becomes Failed
    // and error() says which stage failed. Only an Empty context can init.
    bool init(const AppInfo& app, const ValidationConfig& validation, GLFWwindow* window, Platform platform = current_platform());

    // At most once; a second call is rejected without touching the API.
    void destroy();

    State state() const { return state_; }
    const BootstrapError& error() const { return error_; }

    VkInstance instance() const { return instance_; }
    DebugMessenger::State messenger_state() const { return messenger_.state(); }
    const PhysicalDeviceCandidate& physical() const { return physical_; }
    VkDevice device() const { return device_.device; }
    VkQueue graphics_queue() const { return device_.graphics_queue; }
    VkSurfaceKHR surface() const { return surface_.handle; }
    const SurfaceFunctions& surface_functions() const { return surface_.fns; }

private:
    void release();

    VulkanApi api_;
    State state_{State::Empty};
    BootstrapError error_{};

    VkInstance instance_{};
    DebugMessenger messenger_{};
    PhysicalDeviceCandidate physical_{};
    LogicalDevice device_{};
    Surface surface_{};
};

}
