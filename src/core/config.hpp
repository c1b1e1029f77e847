#pragma once

#include <cstdint>
#include <string>

#include <vulkan/vulkan.h>

#ifndef KINDLE_ENABLE_VALIDATION
#define KINDLE_ENABLE_VALIDATION 0
#endif

namespace kindle {

inline constexpr const char* VALIDATION_LAYER_NAME = "VK_LAYER_KHRONOS_validation";

// Fixed for the whole run once parse_args has returned.
struct ValidationConfig {
    bool enabled{KINDLE_ENABLE_VALIDATION != 0};
    const char* layer_name{VALIDATION_LAYER_NAME};
};

struct AppInfo {
    std::string app_name{"kindle"};
    std::uint32_t app_version{VK_MAKE_API_VERSION(0, 0, 1, 0)};
    std::string engine_name{"kindle"};
    std::uint32_t engine_version{VK_MAKE_API_VERSION(0, 0, 1, 0)};
    std::uint32_t api_version{VK_API_VERSION_1_3};
};

// Largest accepted window extent; keeps sizes inside GLFW's int range.
inline constexpr std::uint32_t MAX_WINDOW_EXTENT = 16384;

struct WindowConfig {
    std::uint32_t width{1280};
    std::uint32_t height{720};
    std::string title{"kindle"};
};

struct AppConfig {
    ValidationConfig validation{};
    AppInfo app{};
    WindowConfig window{};
    std::string log_path{"kindle.log"};
    bool show_help{false};
};

bool parse_args(int argc, const char* const* argv, AppConfig& out, std::string& error);
void print_usage(const char* exe);

}
