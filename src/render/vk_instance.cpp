#include "vk_instance.hpp"

#include "core/log.hpp"
#include "render/debug_messenger.hpp"

#include <cstring>

namespace kindle::render {

namespace {

void push_unique(std::vector<const char*>& list, const char* name) {
    for (const char* n : list) {
        if (std::strcmp(n, name) == 0) return;
    }
    list.push_back(name);
}

}

InstanceRequest negotiate_instance(Platform platform,
                                   const ValidationConfig& validation,
                                   uint32_t api_version,
                                   const std::vector<const char*>& platform_extensions) {
    InstanceRequest req;
    req.extensions.reserve(platform_extensions.size() + 3);
    for (const char* ext : platform_extensions) push_unique(req.extensions, ext);

    if (validation.enabled) {
        push_unique(req.extensions, VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
        req.layers.push_back(validation.layer_name);
    }

    if (platform == Platform::MacOS && api_version <= PORTABILITY_MACOS_VERSION) {
        push_unique(req.extensions, VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME);
        push_unique(req.extensions, VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME);
        req.flags |= VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR;
    }
    return req;
}

bool has_layer(const std::vector<VkLayerProperties>& layers, const char* name) {
    for (const auto& l : layers) {
        if (std::strcmp(l.layerName, name) == 0) return true;
    }
    return false;
}

bool create_instance(InstanceOps& ops,
                     const AppInfo& app,
                     const InstanceRequest& request,
                     const ValidationConfig& validation,
                     VkInstance& out,
                     BootstrapError& err) {
    if (validation.enabled) {
        std::vector<VkLayerProperties> layers;
        const VkResult r = ops.enumerate_layers(layers);
        if (r != VK_SUCCESS) {
            return fail(err, ErrorKind::Initialization, "layer enumeration", r, "vkEnumerateInstanceLayerProperties failed");
        }
        if (!has_layer(layers, validation.layer_name)) {
            return fail(err, ErrorKind::Configuration, "validation layer", VK_ERROR_LAYER_NOT_PRESENT,
                        std::string("validation requested but ") + validation.layer_name + " is not available");
        }
    }

    VkApplicationInfo info{};
    info.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    info.pApplicationName = app.app_name.c_str();
    info.applicationVersion = app.app_version;
    info.pEngineName = app.engine_name.c_str();
    info.engineVersion = app.engine_version;
    info.apiVersion = app.api_version;

    // Chained so messages from vkCreateInstance itself are reported.
    VkDebugUtilsMessengerCreateInfoEXT dbg = debug_messenger_info();

    VkInstanceCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    ci.flags = request.flags;
    ci.pApplicationInfo = &info;
    ci.enabledExtensionCount = static_cast<uint32_t>(request.extensions.size());
    ci.ppEnabledExtensionNames = request.extensions.empty() ? nullptr : request.extensions.data();
    if (validation.enabled) {
        ci.enabledLayerCount = static_cast<uint32_t>(request.layers.size());
        ci.ppEnabledLayerNames = request.layers.empty() ? nullptr : request.layers.data();
        ci.pNext = &dbg;
    }

    for (const char* ext : request.extensions) LOG_INFO("Vulkan", "instance extension: %s", ext);
    for (const char* layer : request.layers) LOG_INFO("Vulkan", "instance layer: %s", layer);

    VkInstance instance = VK_NULL_HANDLE;
    const VkResult r = ops.create_instance(ci, instance);
    if (r != VK_SUCCESS || instance == VK_NULL_HANDLE) {
        return fail(err, ErrorKind::Initialization, "instance", r == VK_SUCCESS ? VK_ERROR_INITIALIZATION_FAILED : r,
                    "vkCreateInstance failed");
    }
    out = instance;
    return true;
}

}
