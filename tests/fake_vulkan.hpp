#pragma once

#include "render/vk_api.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace kindle::test {

template <class H>
H fake_handle(std::uintptr_t v) {
    if constexpr (std::is_pointer_v<H>) return reinterpret_cast<H>(v);
    else return static_cast<H>(v);
}

template <class H>
std::uintptr_t handle_value(H h) {
    if constexpr (std::is_pointer_v<H>) return reinterpret_cast<std::uintptr_t>(h);
    else return static_cast<std::uintptr_t>(h);
}

inline constexpr std::uintptr_t INSTANCE_ID = 0x1000;
inline constexpr std::uintptr_t MESSENGER_ID = 0x2000;
inline constexpr std::uintptr_t DEVICE_BASE = 0x3000;
inline constexpr std::uintptr_t LOGICAL_ID = 0x4000;
inline constexpr std::uintptr_t QUEUE_ID = 0x5000;
inline constexpr std::uintptr_t SURFACE_ID = 0x6000;

// Shared by all fakes so cross-interface call order is observable.
struct CallLog {
    std::vector<std::string> calls;

    void add(std::string_view name) { calls.emplace_back(name); }
    int index_of(std::string_view name) const {
        for (size_t i = 0; i < calls.size(); ++i) {
            if (calls[i] == name) return static_cast<int>(i);
        }
        return -1;
    }
    int count(std::string_view name) const {
        int n = 0;
        for (const auto& c : calls) n += c == name ? 1 : 0;
        return n;
    }
    bool has(std::string_view name) const { return index_of(name) >= 0; }
};

inline VkQueueFamilyProperties family(VkQueueFlags flags, uint32_t count = 1) {
    VkQueueFamilyProperties p{};
    p.queueFlags = flags;
    p.queueCount = count;
    return p;
}

struct FakeGpu {
    std::string name;
    VkPhysicalDeviceType type{VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU};
    std::vector<VkQueueFamilyProperties> families;
};

class FakeInstanceOps final : public render::InstanceOps {
public:
    explicit FakeInstanceOps(CallLog& log) : log_(log) {}

    std::vector<std::string> layers{"VK_LAYER_KHRONOS_validation"};
    std::vector<FakeGpu> gpus;
    VkResult layer_result{VK_SUCCESS};
    VkResult instance_result{VK_SUCCESS};
    VkResult messenger_result{VK_SUCCESS};
    VkResult enumerate_result{VK_SUCCESS};
    // Fires the chained debug callback from inside create_instance when set.
    const char* message_during_create{};

    std::vector<std::string> seen_extensions;
    std::vector<std::string> seen_layers;
    VkInstanceCreateFlags seen_flags{};
    uint32_t seen_api_version{};
    bool seen_debug_chain{false};

    VkResult enumerate_layers(std::vector<VkLayerProperties>& out) override {
        log_.add("enumerate_layers");
        out.clear();
        for (const auto& l : layers) {
            VkLayerProperties p{};
            std::strncpy(p.layerName, l.c_str(), VK_MAX_EXTENSION_NAME_SIZE - 1);
            out.push_back(p);
        }
        return layer_result;
    }

    VkResult create_instance(const VkInstanceCreateInfo& ci, VkInstance& out) override {
        log_.add("create_instance");
        seen_extensions.assign(ci.ppEnabledExtensionNames, ci.ppEnabledExtensionNames + ci.enabledExtensionCount);
        seen_layers.assign(ci.ppEnabledLayerNames, ci.ppEnabledLayerNames + ci.enabledLayerCount);
        seen_flags = ci.flags;
        seen_api_version = ci.pApplicationInfo ? ci.pApplicationInfo->apiVersion : 0;
        const auto* chained = static_cast<const VkDebugUtilsMessengerCreateInfoEXT*>(ci.pNext);
        seen_debug_chain = chained && chained->sType == VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
        if (seen_debug_chain && message_during_create) {
            VkDebugUtilsMessengerCallbackDataEXT data{};
            data.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CALLBACK_DATA_EXT;
            data.pMessage = message_during_create;
            chained->pfnUserCallback(VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT,
                                     VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT, &data, nullptr);
        }
        if (instance_result != VK_SUCCESS) return instance_result;
        out = fake_handle<VkInstance>(INSTANCE_ID);
        return VK_SUCCESS;
    }

    void destroy_instance(VkInstance) override { log_.add("destroy_instance"); }

    VkResult create_debug_messenger(VkInstance, const VkDebugUtilsMessengerCreateInfoEXT&, VkDebugUtilsMessengerEXT& out) override {
        log_.add("create_messenger");
        if (messenger_result != VK_SUCCESS) return messenger_result;
        out = fake_handle<VkDebugUtilsMessengerEXT>(MESSENGER_ID);
        return VK_SUCCESS;
    }

    void destroy_debug_messenger(VkInstance, VkDebugUtilsMessengerEXT) override { log_.add("destroy_messenger"); }

    VkResult enumerate_physical_devices(VkInstance, std::vector<VkPhysicalDevice>& out) override {
        log_.add("enumerate_devices");
        out.clear();
        if (enumerate_result != VK_SUCCESS) return enumerate_result;
        for (size_t i = 0; i < gpus.size(); ++i) out.push_back(fake_handle<VkPhysicalDevice>(DEVICE_BASE + i));
        return VK_SUCCESS;
    }

    void queue_families(VkPhysicalDevice device, std::vector<VkQueueFamilyProperties>& out) override {
        out = gpus[index(device)].families;
    }

    void properties(VkPhysicalDevice device, VkPhysicalDeviceProperties& out) override {
        const FakeGpu& g = gpus[index(device)];
        out = VkPhysicalDeviceProperties{};
        std::strncpy(out.deviceName, g.name.c_str(), VK_MAX_PHYSICAL_DEVICE_NAME_SIZE - 1);
        out.deviceType = g.type;
    }

    static size_t index(VkPhysicalDevice device) { return handle_value(device) - DEVICE_BASE; }

private:
    CallLog& log_;
};

class FakeDeviceOps final : public render::DeviceOps {
public:
    explicit FakeDeviceOps(CallLog& log) : log_(log) {}

    VkResult device_result{VK_SUCCESS};

    VkPhysicalDevice seen_physical{};
    uint32_t seen_queue_infos{};
    uint32_t seen_family{};
    uint32_t seen_queue_count{};
    float seen_priority{};
    uint32_t seen_extension_count{};
    uint32_t seen_queue_index{~0u};

    VkResult create_device(VkPhysicalDevice physical, const VkDeviceCreateInfo& ci, VkDevice& out) override {
        log_.add("create_device");
        seen_physical = physical;
        seen_queue_infos = ci.queueCreateInfoCount;
        if (ci.queueCreateInfoCount > 0) {
            seen_family = ci.pQueueCreateInfos[0].queueFamilyIndex;
            seen_queue_count = ci.pQueueCreateInfos[0].queueCount;
            seen_priority = ci.pQueueCreateInfos[0].pQueuePriorities[0];
        }
        seen_extension_count = ci.enabledExtensionCount;
        if (device_result != VK_SUCCESS) return device_result;
        out = fake_handle<VkDevice>(LOGICAL_ID);
        return VK_SUCCESS;
    }

    VkQueue get_queue(VkDevice, uint32_t family, uint32_t index) override {
        log_.add("get_queue");
        seen_family = family;
        seen_queue_index = index;
        return fake_handle<VkQueue>(QUEUE_ID);
    }

    void destroy_device(VkDevice) override { log_.add("destroy_device"); }

private:
    CallLog& log_;
};

namespace surface_stubs {

inline VKAPI_ATTR VkResult VKAPI_CALL support(VkPhysicalDevice, uint32_t, VkSurfaceKHR, VkBool32* out) {
    *out = VK_TRUE;
    return VK_SUCCESS;
}
inline VKAPI_ATTR VkResult VKAPI_CALL capabilities(VkPhysicalDevice, VkSurfaceKHR, VkSurfaceCapabilitiesKHR* out) {
    *out = VkSurfaceCapabilitiesKHR{};
    out->minImageCount = 2;
    return VK_SUCCESS;
}
inline VKAPI_ATTR VkResult VKAPI_CALL formats(VkPhysicalDevice, VkSurfaceKHR, uint32_t* count, VkSurfaceFormatKHR*) {
    *count = 0;
    return VK_SUCCESS;
}
inline VKAPI_ATTR VkResult VKAPI_CALL present_modes(VkPhysicalDevice, VkSurfaceKHR, uint32_t* count, VkPresentModeKHR*) {
    *count = 0;
    return VK_SUCCESS;
}
inline VKAPI_ATTR void VKAPI_CALL destroy(VkInstance, VkSurfaceKHR, const VkAllocationCallbacks*) {}

}

class FakeSurfaceOps final : public render::SurfaceOps {
public:
    explicit FakeSurfaceOps(CallLog& log) : log_(log) {}

    std::vector<const char*> extensions{"VK_KHR_surface", "VK_KHR_xcb_surface"};
    VkResult surface_result{VK_SUCCESS};
    bool functions_ok{true};

    bool required_extensions(std::vector<const char*>& out) override {
        out = extensions;
        return !extensions.empty();
    }

    VkResult create_surface(VkInstance, GLFWwindow*, VkSurfaceKHR& out) override {
        log_.add("create_surface");
        if (surface_result != VK_SUCCESS) return surface_result;
        out = fake_handle<VkSurfaceKHR>(SURFACE_ID);
        return VK_SUCCESS;
    }

    // Fills every entry point except destroy when functions_ok is false.
    bool load_functions(VkInstance, render::SurfaceFunctions& out) override {
        log_.add("load_surface_functions");
        out.support = surface_stubs::support;
        out.capabilities = surface_stubs::capabilities;
        out.formats = surface_stubs::formats;
        out.present_modes = surface_stubs::present_modes;
        out.destroy = functions_ok ? surface_stubs::destroy : nullptr;
        return out.complete();
    }

    void destroy_surface(VkInstance, VkSurfaceKHR) override { log_.add("destroy_surface"); }

private:
    CallLog& log_;
};

inline GLFWwindow* fake_window() {
    static int token = 0;
    return reinterpret_cast<GLFWwindow*>(&token);
}

}
