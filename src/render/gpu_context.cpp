#include "gpu_context.hpp"

#include "core/log.hpp"
#include "core/profile.hpp"

namespace kindle::render {

GpuContext::~GpuContext() {
    if (state_ == State::Live) destroy();
}

bool GpuContext::init(const AppInfo& app, const ValidationConfig& validation, GLFWwindow* window, Platform platform) {
    KINDLE_PROFILE_SCOPE_N("GpuContext::init");
    if (state_ != State::Empty) {
        return fail(error_, ErrorKind::Initialization, "bootstrap", VK_SUCCESS, "context already initialized");
    }

    std::vector<const char*> platform_exts;
    if (!api_.surface.required_extensions(platform_exts)) {
        state_ = State::Failed;
        return fail(error_, ErrorKind::Initialization, "surface extensions", VK_ERROR_EXTENSION_NOT_PRESENT,
                    "windowing system reports no Vulkan instance extensions");
    }
    const InstanceRequest request = negotiate_instance(platform, validation, app.api_version, platform_exts);

    {
        KINDLE_PROFILE_SCOPE_N("instance");
        if (!create_instance(api_.instance, app, request, validation, instance_, error_)) {
            state_ = State::Failed;
            return false;
        }
    }
    LOG_INFO("Vulkan", "instance created (validation %s)", validation.enabled ? "on" : "off");

    // Partially built: a failing stage below leaves cleanup to release().
    state_ = State::Live;

    bool ok = messenger_.create(api_.instance, instance_, validation, error_);
    if (ok) {
        KINDLE_PROFILE_SCOPE_N("physical device");
        ok = select_physical_device(api_.instance, instance_, physical_, error_);
    }
    if (ok) {
        KINDLE_PROFILE_SCOPE_N("logical device");
        ok = create_logical_device(api_.device, physical_, device_, error_);
    }
    if (ok) {
        KINDLE_PROFILE_SCOPE_N("surface");
        ok = bind_surface(api_.surface, instance_, window, surface_, error_);
    }
    if (!ok) {
        release();
        state_ = State::Failed;
        return false;
    }
    LOG_INFO("Vulkan", "bootstrap complete");
    return true;
}

void GpuContext::destroy() {
    if (state_ == State::Failed) return;
    if (state_ == State::Destroyed) {
        LOG_ERROR("Vulkan", "GpuContext::destroy called twice, ignored");
        return;
    }
    release();
    state_ = State::Destroyed;
    LOG_INFO("Vulkan", "context destroyed");
}

void GpuContext::release() {
    messenger_.destroy(api_.instance, instance_);
    if (device_.device) api_.device.destroy_device(device_.device);
    device_ = {};
    physical_ = {};
    if (surface_.handle) api_.surface.destroy_surface(instance_, surface_.handle);
    surface_ = {};
    if (instance_) api_.instance.destroy_instance(instance_);
    instance_ = VK_NULL_HANDLE;
}

}
