#include "debug_messenger.hpp"

#include "core/log.hpp"

#include <cstdio>

namespace kindle::render {

const char* severity_tag(VkDebugUtilsMessageSeverityFlagBitsEXT severity) {
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) return "[Error]";
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) return "[Warning]";
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT) return "[Info]";
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT) return "[Verbose]";
    return "[Unknown]";
}

const char* type_tag(VkDebugUtilsMessageTypeFlagsEXT type) {
    if (type & VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT) return "[Validation]";
    if (type & VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT) return "[Performance]";
    if (type & VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT) return "[General]";
    return "[Unknown]";
}

size_t format_debug_message(char* buf,
                            size_t size,
                            VkDebugUtilsMessageSeverityFlagBitsEXT severity,
                            VkDebugUtilsMessageTypeFlagsEXT type,
                            const char* message) {
    if (!buf || size == 0) return 0;
    const int n = std::snprintf(buf, size, "[Debug]%s%s%s",
                                severity_tag(severity), type_tag(type), message ? message : "");
    if (n < 0) {
        buf[0] = '\0';
        return 0;
    }
    return static_cast<size_t>(n) < size ? static_cast<size_t>(n) : size - 1;
}

VKAPI_ATTR VkBool32 VKAPI_CALL on_vk_debug(VkDebugUtilsMessageSeverityFlagBitsEXT severity,
                                           VkDebugUtilsMessageTypeFlagsEXT type,
                                           const VkDebugUtilsMessengerCallbackDataEXT* data,
                                           void*) {
    char line[2048];
    format_debug_message(line, sizeof(line), severity, type, data ? data->pMessage : nullptr);

    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) {
        LOG_ERROR("Vulkan", "%s", line);
    } else if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) {
        LOG_WARN("Vulkan", "%s", line);
    } else {
        LOG_INFO("Vulkan", "%s", line);
    }
    return VK_FALSE;
}

VkDebugUtilsMessengerCreateInfoEXT debug_messenger_info() {
    VkDebugUtilsMessengerCreateInfoEXT dbg{};
    dbg.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    dbg.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT |
                          VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                          VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    dbg.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                      VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT |
                      VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT;
    dbg.pfnUserCallback = on_vk_debug;
    return dbg;
}

bool DebugMessenger::create(InstanceOps& ops, VkInstance instance, const ValidationConfig& validation, BootstrapError& err) {
    if (!validation.enabled) {
        state_ = State::Disabled;
        return true;
    }
    const VkDebugUtilsMessengerCreateInfoEXT dbg = debug_messenger_info();
    VkDebugUtilsMessengerEXT messenger = VK_NULL_HANDLE;
    const VkResult r = ops.create_debug_messenger(instance, dbg, messenger);
    if (r != VK_SUCCESS) {
        return fail(err, ErrorKind::Initialization, "debug messenger", r, "vkCreateDebugUtilsMessengerEXT failed");
    }
    messenger_ = messenger;
    state_ = State::Created;
    return true;
}

void DebugMessenger::destroy(InstanceOps& ops, VkInstance instance) {
    if (state_ == State::Created) ops.destroy_debug_messenger(instance, messenger_);
    messenger_ = VK_NULL_HANDLE;
    state_ = State::Destroyed;
}

}
