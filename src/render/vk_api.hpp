#pragma once

#include <vector>
#include <vulkan/vulkan.h>

struct GLFWwindow;

namespace kindle::render {

// Entry points needed by the swapchain code to query a bound surface.
struct SurfaceFunctions {
    PFN_vkGetPhysicalDeviceSurfaceSupportKHR support{};
    PFN_vkGetPhysicalDeviceSurfaceCapabilitiesKHR capabilities{};
    PFN_vkGetPhysicalDeviceSurfaceFormatsKHR formats{};
    PFN_vkGetPhysicalDeviceSurfacePresentModesKHR present_modes{};
    PFN_vkDestroySurfaceKHR destroy{};

    bool complete() const { return support && capabilities && formats && present_modes && destroy; }
};

class InstanceOps {
public:
    virtual ~InstanceOps() = default;

    virtual VkResult enumerate_layers(std::vector<VkLayerProperties>& out) = 0;
    virtual VkResult create_instance(const VkInstanceCreateInfo& ci, VkInstance& out) = 0;
    virtual void destroy_instance(VkInstance instance) = 0;

    virtual VkResult create_debug_messenger(VkInstance instance,
                                            const VkDebugUtilsMessengerCreateInfoEXT& ci,
                                            VkDebugUtilsMessengerEXT& out) = 0;
    virtual void destroy_debug_messenger(VkInstance instance, VkDebugUtilsMessengerEXT messenger) = 0;

    virtual VkResult enumerate_physical_devices(VkInstance instance, std::vector<VkPhysicalDevice>& out) = 0;
    virtual void queue_families(VkPhysicalDevice device, std::vector<VkQueueFamilyProperties>& out) = 0;
    virtual void properties(VkPhysicalDevice device, VkPhysicalDeviceProperties& out) = 0;
};

class DeviceOps {
public:
    virtual ~DeviceOps() = default;

    virtual VkResult create_device(VkPhysicalDevice physical, const VkDeviceCreateInfo& ci, VkDevice& out) = 0;
    virtual VkQueue get_queue(VkDevice device, uint32_t family, uint32_t index) = 0;
    virtual void destroy_device(VkDevice device) = 0;
};

class SurfaceOps {
public:
    virtual ~SurfaceOps() = default;

    // Instance extensions the windowing system needs to present, in its order.
    virtual bool required_extensions(std::vector<const char*>& out) = 0;
    virtual VkResult create_surface(VkInstance instance, GLFWwindow* window, VkSurfaceKHR& out) = 0;
    virtual bool load_functions(VkInstance instance, SurfaceFunctions& out) = 0;
    virtual void destroy_surface(VkInstance instance, VkSurfaceKHR surface) = 0;
};

struct VulkanApi {
    InstanceOps& instance;
    DeviceOps& device;
    SurfaceOps& surface;
};

class VulkanInstanceOps final : public InstanceOps {
public:
    VkResult enumerate_layers(std::vector<VkLayerProperties>& out) override;
    VkResult create_instance(const VkInstanceCreateInfo& ci, VkInstance& out) override;
    void destroy_instance(VkInstance instance) override;
    VkResult create_debug_messenger(VkInstance instance,
                                    const VkDebugUtilsMessengerCreateInfoEXT& ci,
                                    VkDebugUtilsMessengerEXT& out) override;
    void destroy_debug_messenger(VkInstance instance, VkDebugUtilsMessengerEXT messenger) override;
    VkResult enumerate_physical_devices(VkInstance instance, std::vector<VkPhysicalDevice>& out) override;
    void queue_families(VkPhysicalDevice device, std::vector<VkQueueFamilyProperties>& out) override;
    void properties(VkPhysicalDevice device, VkPhysicalDeviceProperties& out) override;
};

class VulkanDeviceOps final : public DeviceOps {
public:
    VkResult create_device(VkPhysicalDevice physical, const VkDeviceCreateInfo& ci, VkDevice& out) override;
    VkQueue get_queue(VkDevice device, uint32_t family, uint32_t index) override;
    void destroy_device(VkDevice device) override;
};

// Resolves the surface query entry points through vkGetInstanceProcAddr.
bool load_surface_functions(VkInstance instance, SurfaceFunctions& out);

}
