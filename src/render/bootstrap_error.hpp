#pragma once

#include <string>
#include <vulkan/vulkan.h>

namespace kindle::render {

enum class ErrorKind : unsigned char {
    Configuration,   // requested validation layer missing
    Initialization,  // an API call was rejected by the runtime
    DeviceSelection, // no device exposes a graphics queue family
};

struct BootstrapError {
    ErrorKind kind{ErrorKind::Initialization};
    std::string stage;
    VkResult result{VK_SUCCESS};
    std::string detail;
};

const char* kind_name(ErrorKind kind);
const char* vk_result_name(VkResult result);

// "<kind> error in <stage>: <detail> (<VkResult>)"
std::string describe(const BootstrapError& err);

// Fills err and logs it under the "Vulkan" category. Always returns false.
bool fail(BootstrapError& err, ErrorKind kind, const char* stage, VkResult result, std::string detail);

}
