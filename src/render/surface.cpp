#include "surface.hpp"

namespace kindle::render {

bool bind_surface(SurfaceOps& ops, VkInstance instance, GLFWwindow* window, Surface& out, BootstrapError& err) {
    if (!window) {
        return fail(err, ErrorKind::Initialization, "surface", VK_ERROR_INITIALIZATION_FAILED, "no window to bind");
    }

    VkSurfaceKHR surface = VK_NULL_HANDLE;
    const VkResult r = ops.create_surface(instance, window, surface);
    if (r != VK_SUCCESS || surface == VK_NULL_HANDLE) {
        return fail(err, ErrorKind::Initialization, "surface", r == VK_SUCCESS ? VK_ERROR_INITIALIZATION_FAILED : r,
                    "platform could not create a surface for the window");
    }

    // Owned by the caller from here on, even if the loader fails.
    out.handle = surface;
    if (!ops.load_functions(instance, out.fns)) {
        return fail(err, ErrorKind::Initialization, "surface loader", VK_ERROR_EXTENSION_NOT_PRESENT,
                    "VK_KHR_surface entry points unavailable");
    }
    return true;
}

}
