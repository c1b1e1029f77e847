#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <vulkan/vulkan.h>

#include "render/bootstrap_error.hpp"
#include "render/vk_api.hpp"

namespace kindle::render {

// Borrowed from the instance's enumeration; valid while the instance lives.
struct PhysicalDeviceCandidate {
    VkPhysicalDevice device{};
    uint32_t graphics_family{};
    uint32_t device_index{};
};

struct LogicalDevice {
    VkDevice device{};
    VkQueue graphics_queue{}; // owned by device
};

std::optional<uint32_t> find_graphics_family(const std::vector<VkQueueFamilyProperties>& families);

// First device, in enumeration order, with a graphics-capable family wins.
bool select_physical_device(InstanceOps& ops, VkInstance instance, PhysicalDeviceCandidate& out, BootstrapError& err);

// One queue from the candidate's family, default priority, no extensions or features.
bool create_logical_device(DeviceOps& ops, const PhysicalDeviceCandidate& candidate, LogicalDevice& out, BootstrapError& err);

}
