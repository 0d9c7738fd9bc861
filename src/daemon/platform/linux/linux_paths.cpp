#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <format>
#include <unistd.h>

namespace platform {

namespace {

// $XDG_<var>/sweepwatch, else $HOME/<home_fallback>/sweepwatch.
std::string xdg_app_dir(const char* var, const char* home_fallback) {
    if (const char* xdg = std::getenv(var); xdg && *xdg) {
        return std::string(xdg) + "/sweepwatch";
    }
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::format("{}/{}/sweepwatch", home, home_fallback);
}

} // namespace

std::string config_dir() {
    return xdg_app_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_app_dir("XDG_DATA_HOME", ".local/share");
}

std::string ipc_endpoint() {
    if (const char* xdg = std::getenv("XDG_RUNTIME_DIR"); xdg && *xdg) {
        return std::string(xdg) + "/sweepwatch.sock";
    }
    return std::format("/tmp/sweepwatch-{}.sock", ::getuid());
}

} // namespace platform
