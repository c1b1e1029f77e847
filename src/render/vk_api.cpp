#include "vk_api.hpp"

namespace kindle::render {

VkResult VulkanInstanceOps::enumerate_layers(std::vector<VkLayerProperties>& out) {
    uint32_t count = 0;
    VkResult r = vkEnumerateInstanceLayerProperties(&count, nullptr);
    if (r != VK_SUCCESS) return r;
    out.resize(count);
    r = vkEnumerateInstanceLayerProperties(&count, out.data());
    out.resize(count);
    return r == VK_INCOMPLETE ? VK_SUCCESS : r;
}

VkResult VulkanInstanceOps::create_instance(const VkInstanceCreateInfo& ci, VkInstance& out) {
    return vkCreateInstance(&ci, nullptr, &out);
}

void VulkanInstanceOps::destroy_instance(VkInstance instance) {
    vkDestroyInstance(instance, nullptr);
}

VkResult VulkanInstanceOps::create_debug_messenger(VkInstance instance,
                                                   const VkDebugUtilsMessengerCreateInfoEXT& ci,
                                                   VkDebugUtilsMessengerEXT& out) {
    auto create = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(instance, "vkCreateDebugUtilsMessengerEXT"));
    if (!create) return VK_ERROR_EXTENSION_NOT_PRESENT;
    return create(instance, &ci, nullptr, &out);
}

void VulkanInstanceOps::destroy_debug_messenger(VkInstance instance, VkDebugUtilsMessengerEXT messenger) {
    auto destroy = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(instance, "vkDestroyDebugUtilsMessengerEXT"));
    if (destroy) destroy(instance, messenger, nullptr);
}

VkResult VulkanInstanceOps::enumerate_physical_devices(VkInstance instance, std::vector<VkPhysicalDevice>& out) {
    uint32_t count = 0;
    VkResult r = vkEnumeratePhysicalDevices(instance, &count, nullptr);
    if (r != VK_SUCCESS) return r;
    out.resize(count);
    r = vkEnumeratePhysicalDevices(instance, &count, out.data());
    out.resize(count);
    return r == VK_INCOMPLETE ? VK_SUCCESS : r;
}

void VulkanInstanceOps::queue_families(VkPhysicalDevice device, std::vector<VkQueueFamilyProperties>& out) {
    uint32_t count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(device, &count, nullptr);
    out.resize(count);
    vkGetPhysicalDeviceQueueFamilyProperties(device, &count, out.data());
}

void VulkanInstanceOps::properties(VkPhysicalDevice device, VkPhysicalDeviceProperties& out) {
    vkGetPhysicalDeviceProperties(device, &out);
}

VkResult VulkanDeviceOps::create_device(VkPhysicalDevice physical, const VkDeviceCreateInfo& ci, VkDevice& out) {
    return vkCreateDevice(physical, &ci, nullptr, &out);
}

VkQueue VulkanDeviceOps::get_queue(VkDevice device, uint32_t family, uint32_t index) {
    VkQueue queue = VK_NULL_HANDLE;
    vkGetDeviceQueue(device, family, index, &queue);
    return queue;
}

void VulkanDeviceOps::destroy_device(VkDevice device) {
    vkDestroyDevice(device, nullptr);
}

bool load_surface_functions(VkInstance instance, SurfaceFunctions& out) {
    out.support = reinterpret_cast<PFN_vkGetPhysicalDeviceSurfaceSupportKHR>(
        vkGetInstanceProcAddr(instance, "vkGetPhysicalDeviceSurfaceSupportKHR"));
    out.capabilities = reinterpret_cast<PFN_vkGetPhysicalDeviceSurfaceCapabilitiesKHR>(
        vkGetInstanceProcAddr(instance, "vkGetPhysicalDeviceSurfaceCapabilitiesKHR"));
    out.formats = reinterpret_cast<PFN_vkGetPhysicalDeviceSurfaceFormatsKHR>(
        vkGetInstanceProcAddr(instance, "vkGetPhysicalDeviceSurfaceFormatsKHR"));
    out.present_modes = reinterpret_cast<PFN_vkGetPhysicalDeviceSurfacePresentModesKHR>(
        vkGetInstanceProcAddr(instance, "vkGetPhysicalDeviceSurfacePresentModesKHR"));
    out.destroy = reinterpret_cast<PFN_vkDestroySurfaceKHR>(
        vkGetInstanceProcAddr(instance, "vkDestroySurfaceKHR"));
    return out.complete();
}

}
