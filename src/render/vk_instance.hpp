#pragma once

#include <cstdint>
#include <vector>
#include <vulkan/vulkan.h>

#include "core/config.hpp"
#include "render/bootstrap_error.hpp"
#include "render/vk_api.hpp"

namespace kindle::render {

enum class Platform : unsigned char { Windows, Linux, MacOS, Other };

constexpr Platform current_platform() {
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Other;
#endif
}

// Loader version from which MoltenVK is only enumerated with the portability extensions.
inline constexpr uint32_t PORTABILITY_MACOS_VERSION = VK_MAKE_API_VERSION(0, 1, 3, 216);

struct InstanceRequest {
    std::vector<const char*> extensions;
    std::vector<const char*> layers;
    VkInstanceCreateFlags flags{};
};

// Pure: same inputs always give the same lists in the same order.
InstanceRequest negotiate_instance(Platform platform,
                                   const ValidationConfig& validation,
                                   uint32_t api_version,
                                   const std::vector<const char*>& platform_extensions);

bool has_layer(const std::vector<VkLayerProperties>& layers, const char* name);

bool create_instance(InstanceOps& ops,
                     const AppInfo& app,
                     const InstanceRequest& request,
                     const ValidationConfig& validation,
                     VkInstance& out,
                     BootstrapError& err);

}
