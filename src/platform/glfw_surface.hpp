#pragma once

#include "render/vk_api.hpp"

namespace kindle::platform {

class GlfwSurfaceOps final : public render::SurfaceOps {
public:
    bool required_extensions(std::vector<const char*>& out) override;
    VkResult create_surface(VkInstance instance, GLFWwindow* window, VkSurfaceKHR& out) override;
    bool load_functions(VkInstance instance, render::SurfaceFunctions& out) override;
    void destroy_surface(VkInstance instance, VkSurfaceKHR surface) override;
};

}
