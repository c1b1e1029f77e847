#include "fake_vulkan.hpp"

#include "core/log.hpp"
#include "render/vk_instance.hpp"

#include <cstdio>
#include <string>
#include <vector>

using namespace kindle;
using namespace kindle::render;

static int nfail(int code, const char* what) {
    std::fprintf(stderr, "kindle_tests: FAIL(%d): %s\n", code, what);
    return code;
}

static bool contains(const std::vector<const char*>& list, const char* name) {
    for (const char* n : list) {
        if (std::string(n) == name) return true;
    }
    return false;
}

static bool same(const InstanceRequest& a, const InstanceRequest& b) {
    if (a.flags != b.flags || a.extensions.size() != b.extensions.size() || a.layers.size() != b.layers.size()) return false;
    for (size_t i = 0; i < a.extensions.size(); ++i) {
        if (std::string(a.extensions[i]) != b.extensions[i]) return false;
    }
    for (size_t i = 0; i < a.layers.size(); ++i) {
        if (std::string(a.layers[i]) != b.layers[i]) return false;
    }
    return true;
}

int run_negotiation_tests() {
    const std::vector<const char*> platform_exts{"VK_KHR_surface", "VK_KHR_xcb_surface"};
    ValidationConfig on{true, VALIDATION_LAYER_NAME};
    ValidationConfig off{false, VALIDATION_LAYER_NAME};

    {
        for (Platform p : {Platform::Linux, Platform::Windows, Platform::MacOS}) {
            for (const ValidationConfig* v : {&on, &off}) {
                const InstanceRequest a = negotiate_instance(p, *v, VK_API_VERSION_1_3, platform_exts);
                const InstanceRequest b = negotiate_instance(p, *v, VK_API_VERSION_1_3, platform_exts);
                if (!same(a, b)) return nfail(101, "negotiation is deterministic");
            }
        }
    }

    {
        const InstanceRequest r = negotiate_instance(Platform::Linux, off, VK_API_VERSION_1_3, platform_exts);
        if (r.extensions.size() != 2) return nfail(102, "validation off keeps platform extensions only");
        if (std::string(r.extensions[0]) != "VK_KHR_surface" || std::string(r.extensions[1]) != "VK_KHR_xcb_surface")
            return nfail(103, "platform extension order preserved");
        if (!r.layers.empty()) return nfail(104, "no layers without validation");
        if (r.flags != 0) return nfail(105, "no portability flag on linux");
    }

    {
        const InstanceRequest r = negotiate_instance(Platform::Linux, on, VK_API_VERSION_1_3, platform_exts);
        if (r.layers.size() != 1 || std::string(r.layers[0]) != VALIDATION_LAYER_NAME) return nfail(106, "validation layer requested");
        if (!contains(r.extensions, VK_EXT_DEBUG_UTILS_EXTENSION_NAME)) return nfail(107, "debug utils with validation");
        if (std::string(r.extensions[0]) != "VK_KHR_surface") return nfail(108, "platform extensions first");
    }

    {
        const InstanceRequest r = negotiate_instance(Platform::MacOS, off, VK_API_VERSION_1_3,
                                                     {"VK_KHR_surface", "VK_EXT_metal_surface"});
        if (!contains(r.extensions, VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME)) return nfail(109, "portability enumeration on macos");
        if (!contains(r.extensions, VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME)) return nfail(110, "properties2 on macos");
        if (!(r.flags & VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR)) return nfail(111, "portability flag on macos");
        if (r.extensions.size() != 4) return nfail(112, "macos extension count");
    }

    {
        const uint32_t newer = VK_MAKE_API_VERSION(0, 1, 4, 0);
        const InstanceRequest r = negotiate_instance(Platform::MacOS, off, newer, platform_exts);
        if (r.flags != 0 || contains(r.extensions, VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME))
            return nfail(113, "no portability above the threshold");
    }

    {
        const InstanceRequest r = negotiate_instance(Platform::Linux, on, VK_API_VERSION_1_3,
                                                     {"VK_KHR_surface", VK_EXT_DEBUG_UTILS_EXTENSION_NAME});
        if (r.extensions.size() != 2) return nfail(114, "duplicate extensions collapsed");
    }

    {
        test::CallLog calls;
        test::FakeInstanceOps ops(calls);
        ops.layers = {"VK_LAYER_LUNARG_api_dump"};
        const InstanceRequest req = negotiate_instance(Platform::Linux, on, VK_API_VERSION_1_3, platform_exts);
        VkInstance inst = VK_NULL_HANDLE;
        BootstrapError err;
        if (create_instance(ops, AppInfo{}, req, on, inst, err)) return nfail(115, "missing layer must fail");
        if (err.kind != ErrorKind::Configuration) return nfail(116, "missing layer is a configuration error");
        if (calls.has("create_instance") || inst != VK_NULL_HANDLE) return nfail(117, "no instance without the layer");
    }

    {
        test::CallLog calls;
        test::FakeInstanceOps ops(calls);
        ops.layers.clear();
        const InstanceRequest req = negotiate_instance(Platform::Linux, off, VK_API_VERSION_1_3, platform_exts);
        VkInstance inst = VK_NULL_HANDLE;
        BootstrapError err;
        if (!create_instance(ops, AppInfo{}, req, off, inst, err)) return nfail(118, "layers are not checked without validation");
        if (calls.has("enumerate_layers")) return nfail(119, "no layer enumeration without validation");
        if (ops.seen_debug_chain) return nfail(120, "no debug chain without validation");
        if (!ops.seen_layers.empty()) return nfail(121, "no layers passed without validation");
        if (ops.seen_extensions.size() != 2) return nfail(122, "extensions passed through");
    }

    {
        log::clear();
        test::CallLog calls;
        test::FakeInstanceOps ops(calls);
        ops.message_during_create = "instance-time message";
        AppInfo app{};
        app.api_version = VK_MAKE_API_VERSION(0, 1, 2, 0);
        const InstanceRequest req = negotiate_instance(Platform::Linux, on, app.api_version, platform_exts);
        VkInstance inst = VK_NULL_HANDLE;
        BootstrapError err;
        if (!create_instance(ops, app, req, on, inst, err)) return nfail(123, "create instance with validation");
        if (!ops.seen_debug_chain) return nfail(124, "debug messenger info chained");
        if (ops.seen_layers.size() != 1) return nfail(125, "validation layer passed");
        if (ops.seen_api_version != app.api_version) return nfail(126, "api version passed");
        bool found = false;
        for (const auto& e : log::snapshot()) {
            if (e.text == "[Debug][Warning][Validation]instance-time message") found = true;
        }
        if (!found) return nfail(127, "messages during vkCreateInstance reach the log");
    }

    {
        test::CallLog calls;
        test::FakeInstanceOps ops(calls);
        ops.instance_result = VK_ERROR_EXTENSION_NOT_PRESENT;
        const InstanceRequest req = negotiate_instance(Platform::Linux, off, VK_API_VERSION_1_3, platform_exts);
        VkInstance inst = VK_NULL_HANDLE;
        BootstrapError err;
        if (create_instance(ops, AppInfo{}, req, off, inst, err)) return nfail(128, "driver rejection fails");
        if (err.kind != ErrorKind::Initialization || err.stage != "instance") return nfail(129, "instance initialization error");
        if (err.result != VK_ERROR_EXTENSION_NOT_PRESENT) return nfail(130, "VkResult kept");
    }

    return 0;
}
