#pragma once

#include <cstddef>
#include <vulkan/vulkan.h>

#include "core/config.hpp"
#include "render/bootstrap_error.hpp"
#include "render/vk_api.hpp"

namespace kindle::render {

const char* severity_tag(VkDebugUtilsMessageSeverityFlagBitsEXT severity);
const char* type_tag(VkDebugUtilsMessageTypeFlagsEXT type);

// Writes "[Debug][Severity][Category]message" into buf, truncating to size.
// Returns the number of characters written, excluding the terminator.
size_t format_debug_message(char* buf,
                            size_t size,
                            VkDebugUtilsMessageSeverityFlagBitsEXT severity,
                            VkDebugUtilsMessageTypeFlagsEXT type,
                            const char* message);

// Runs on whatever thread the driver reports from; only touches the log.
VKAPI_ATTR VkBool32 VKAPI_CALL on_vk_debug(VkDebugUtilsMessageSeverityFlagBitsEXT severity,
                                           VkDebugUtilsMessageTypeFlagsEXT type,
                                           const VkDebugUtilsMessengerCallbackDataEXT* data,
                                           void* user);

// Severities {verbose, warning, error}, types {general, performance, validation}.
VkDebugUtilsMessengerCreateInfoEXT debug_messenger_info();

class DebugMessenger {
public:
    enum class State : unsigned char { Disabled, Created, Destroyed };

    bool create(InstanceOps& ops, VkInstance instance, const ValidationConfig& validation, BootstrapError& err);
    void destroy(InstanceOps& ops, VkInstance instance);

    State state() const { return state_; }
    VkDebugUtilsMessengerEXT handle() const { return messenger_; }

private:
    State state_{State::Disabled};
    VkDebugUtilsMessengerEXT messenger_{};
};

}
