#include "config.hpp"

#include <charconv>
#include <cstdio>
#include <string_view>

namespace kindle {

namespace {

bool parse_u32(std::string_view s, std::uint32_t& out) {
    const char* b = s.data();
    const char* e = s.data() + s.size();
    std::from_chars_result r = std::from_chars(b, e, out, 10);
    return !s.empty() && r.ec == std::errc{} && r.ptr == e;
}

// "1.3" -> VK_API_VERSION_1_3
bool parse_api_version(std::string_view s, std::uint32_t& out) {
    const auto dot = s.find('.');
    if (dot == std::string_view::npos) return false;
    std::uint32_t major = 0, minor = 0;
    if (!parse_u32(s.substr(0, dot), major) || !parse_u32(s.substr(dot + 1), minor)) return false;
    if (major != 1 || minor > 4) return false;
    out = VK_MAKE_API_VERSION(0, major, minor, 0);
    return true;
}

}

bool parse_args(int argc, const char* const* argv, AppConfig& out, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto value = [&](std::string_view& v) -> bool {
            if (i + 1 >= argc) {
                error = std::string("missing value for ") + std::string(arg);
                return false;
            }
            v = argv[++i];
            return true;
        };

        std::string_view v;
        if (arg == "--validation") {
            out.validation.enabled = true;
        } else if (arg == "--no-validation") {
            out.validation.enabled = false;
        } else if (arg == "--width" || arg == "--height") {
            if (!value(v)) return false;
            std::uint32_t n = 0;
            if (!parse_u32(v, n) || n == 0 || n > MAX_WINDOW_EXTENT) {
                error = std::string(arg) + " expects an integer in 1.." + std::to_string(MAX_WINDOW_EXTENT) + ", got '" + std::string(v) + "'";
                return false;
            }
            (arg == "--width" ? out.window.width : out.window.height) = n;
        } else if (arg == "--title") {
            if (!value(v)) return false;
            out.window.title = std::string(v);
            out.app.app_name = out.window.title;
        } else if (arg == "--log") {
            if (!value(v)) return false;
            out.log_path = std::string(v);
        } else if (arg == "--api") {
            if (!value(v)) return false;
            if (!parse_api_version(v, out.app.api_version)) {
                error = "--api expects 1.0 .. 1.4, got '" + std::string(v) + "'";
                return false;
            }
        } else if (arg == "--help" || arg == "-h") {
            out.show_help = true;
        } else {
            error = "unknown option '" + std::string(arg) + "'";
            return false;
        }
    }
    return true;
}

void print_usage(const char* exe) {
    std::fprintf(stderr,
                 "usage: %s [options]\n"
                 "  --validation        enable %s\n"
                 "  --no-validation     disable validation layers\n"
                 "  --width N           window width, 1..16384 (default 1280)\n"
                 "  --height N          window height, 1..16384 (default 720)\n"
                 "  --title S           window and application name\n"
                 "  --api 1.x           requested Vulkan API version (default 1.3)\n"
                 "  --log PATH          log file, empty to disable (default kindle.log)\n"
                 "  --help              show this message\n",
                 exe ? exe : "kindle", VALIDATION_LAYER_NAME);
}

}
