#include "vk_device.hpp"

#include "core/log.hpp"

namespace kindle::render {

namespace {

const char* device_type_name(VkPhysicalDeviceType type) {
    switch (type) {
        case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU: return "integrated";
        case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU: return "discrete";
        case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU: return "virtual";
        case VK_PHYSICAL_DEVICE_TYPE_CPU: return "cpu";
        default: return "other";
    }
}

}

std::optional<uint32_t> find_graphics_family(const std::vector<VkQueueFamilyProperties>& families) {
    for (uint32_t i = 0; i < families.size(); ++i) {
        if (families[i].queueCount > 0 && (families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT)) return i;
    }
    return std::nullopt;
}

bool select_physical_device(InstanceOps& ops, VkInstance instance, PhysicalDeviceCandidate& out, BootstrapError& err) {
    std::vector<VkPhysicalDevice> devices;
    const VkResult r = ops.enumerate_physical_devices(instance, devices);
    if (r != VK_SUCCESS) {
        return fail(err, ErrorKind::Initialization, "physical device enumeration", r, "vkEnumeratePhysicalDevices failed");
    }
    if (devices.empty()) {
        return fail(err, ErrorKind::DeviceSelection, "physical device", VK_SUCCESS, "no Vulkan devices found");
    }

    std::vector<VkQueueFamilyProperties> families;
    for (uint32_t i = 0; i < devices.size(); ++i) {
        VkPhysicalDeviceProperties props{};
        ops.properties(devices[i], props);
        ops.queue_families(devices[i], families);
        const std::optional<uint32_t> graphics = find_graphics_family(families);
        LOG_INFO("Vulkan", "gpu %u: %s (%s)%s", i, props.deviceName, device_type_name(props.deviceType),
                 graphics ? "" : " - no graphics queue");
        if (!graphics) continue;

        out.device = devices[i];
        out.graphics_family = *graphics;
        out.device_index = i;
        LOG_INFO("Vulkan", "selected gpu %u, graphics family %u", i, *graphics);
        return true;
    }
    return fail(err, ErrorKind::DeviceSelection, "physical device", VK_SUCCESS,
                "no device exposes a graphics-capable queue family");
}

bool create_logical_device(DeviceOps& ops, const PhysicalDeviceCandidate& candidate, LogicalDevice& out, BootstrapError& err) {
    float priority = 1.0f;
    VkDeviceQueueCreateInfo qi{};
    qi.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
    qi.queueFamilyIndex = candidate.graphics_family;
    qi.queueCount = 1;
    qi.pQueuePriorities = &priority;

    VkPhysicalDeviceFeatures features{};

    VkDeviceCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    ci.queueCreateInfoCount = 1;
    ci.pQueueCreateInfos = &qi;
    ci.pEnabledFeatures = &features;

    VkDevice device = VK_NULL_HANDLE;
    const VkResult r = ops.create_device(candidate.device, ci, device);
    if (r != VK_SUCCESS || device == VK_NULL_HANDLE) {
        return fail(err, ErrorKind::Initialization, "logical device", r == VK_SUCCESS ? VK_ERROR_INITIALIZATION_FAILED : r,
                    "vkCreateDevice failed");
    }
    out.device = device;
    out.graphics_queue = ops.get_queue(device, candidate.graphics_family, 0);
    return true;
}

}
