#include "bootstrap_error.hpp"

#include "core/log.hpp"

namespace kindle::render {

const char* kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Initialization: return "initialization";
        case ErrorKind::DeviceSelection: return "device selection";
    }
    return "unknown";
}

const char* vk_result_name(VkResult result) {
    switch (result) {
        case VK_SUCCESS: return "VK_SUCCESS";
        case VK_NOT_READY: return "VK_NOT_READY";
        case VK_TIMEOUT: return "VK_TIMEOUT";
        case VK_INCOMPLETE: return "VK_INCOMPLETE";
        case VK_ERROR_OUT_OF_HOST_MEMORY: return "VK_ERROR_OUT_OF_HOST_MEMORY";
        case VK_ERROR_OUT_OF_DEVICE_MEMORY: return "VK_ERROR_OUT_OF_DEVICE_MEMORY";
        case VK_ERROR_INITIALIZATION_FAILED: return "VK_ERROR_INITIALIZATION_FAILED";
        case VK_ERROR_DEVICE_LOST: return "VK_ERROR_DEVICE_LOST";
        case VK_ERROR_LAYER_NOT_PRESENT: return "VK_ERROR_LAYER_NOT_PRESENT";
        case VK_ERROR_EXTENSION_NOT_PRESENT: return "VK_ERROR_EXTENSION_NOT_PRESENT";
        case VK_ERROR_FEATURE_NOT_PRESENT: return "VK_ERROR_FEATURE_NOT_PRESENT";
        case VK_ERROR_INCOMPATIBLE_DRIVER: return "VK_ERROR_INCOMPATIBLE_DRIVER";
        case VK_ERROR_TOO_MANY_OBJECTS: return "VK_ERROR_TOO_MANY_OBJECTS";
        case VK_ERROR_SURFACE_LOST_KHR: return "VK_ERROR_SURFACE_LOST_KHR";
        case VK_ERROR_NATIVE_WINDOW_IN_USE_KHR: return "VK_ERROR_NATIVE_WINDOW_IN_USE_KHR";
        default: break;
    }
    return "VK_ERROR_UNKNOWN";
}

std::string describe(const BootstrapError& err) {
    std::string out = kind_name(err.kind);
    out += " error in ";
    out += err.stage.empty() ? "bootstrap" : err.stage;
    if (!err.detail.empty()) {
        out += ": ";
        out += err.detail;
    }
    if (err.result != VK_SUCCESS) {
        out += " (";
        out += vk_result_name(err.result);
        out += ")";
    }
    return out;
}

bool fail(BootstrapError& err, ErrorKind kind, const char* stage, VkResult result, std::string detail) {
    err.kind = kind;
    err.stage = stage;
    err.result = result;
    err.detail = static_cast<std::string&&>(detail);
    LOG_ERROR("Vulkan", "%s", describe(err).c_str());
    return false;
}

}
