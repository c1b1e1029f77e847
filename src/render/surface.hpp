#pragma once

#include <vulkan/vulkan.h>

#include "render/bootstrap_error.hpp"
#include "render/vk_api.hpp"

namespace kindle::render {

struct Surface {
    VkSurfaceKHR handle{};
    SurfaceFunctions fns{};
};

// On a loader failure out.handle is still set and must be destroyed by the caller.
bool bind_surface(SurfaceOps& ops, VkInstance instance, GLFWwindow* window, Surface& out, BootstrapError& err);

}
