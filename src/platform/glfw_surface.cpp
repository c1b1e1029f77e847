#include "glfw_surface.hpp"

#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>

namespace kindle::platform {

bool GlfwSurfaceOps::required_extensions(std::vector<const char*>& out) {
    uint32_t count = 0;
    const char** names = glfwGetRequiredInstanceExtensions(&count);
    if (!names || count == 0) return false;
    out.assign(names, names + count);
    return true;
}

VkResult GlfwSurfaceOps::create_surface(VkInstance instance, GLFWwindow* window, VkSurfaceKHR& out) {
    return glfwCreateWindowSurface(instance, window, nullptr, &out);
}

bool GlfwSurfaceOps::load_functions(VkInstance instance, render::SurfaceFunctions& out) {
    return render::load_surface_functions(instance, out);
}

void GlfwSurfaceOps::destroy_surface(VkInstance instance, VkSurfaceKHR surface) {
    vkDestroySurfaceKHR(instance, surface, nullptr);
}

}
