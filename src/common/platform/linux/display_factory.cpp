#include "platform/linux/display_factory.hpp"

#include "platform/linux/command_display_sleeper.hpp"
#include "platform/linux/sway_display_control.hpp"
#include "platform/linux/x11_dpms_display_control.hpp"

#include <cstdlib>

std::string resolve_display_backend(const Config::Display& display) {
    if (display.backend != "auto") return display.backend;
    if (std::getenv("SWAYSOCK")) return "sway";
    return "x11";
}

std::expected<std::unique_ptr<DisplayProbe>, std::string>
make_display_probe(const Config::Display& display) {
    auto backend = resolve_display_backend(display);
    if (backend == "sway") return std::make_unique<SwayDisplayControl>();
    if (backend == "x11") return std::make_unique<X11DpmsDisplayControl>(display.x11_display);
    return std::unexpected("no display probe for backend: " + backend);
}

std::expected<std::unique_ptr<DisplaySleeper>, std::string>
make_display_sleeper(const Config::Display& display) {
    if (!display.sleep_command.empty()) {
        return std::make_unique<CommandDisplaySleeper>(display.sleep_command);
    }

    auto backend = resolve_display_backend(display);
    if (backend == "sway") return std::make_unique<SwayDisplayControl>();
    if (backend == "x11") return std::make_unique<X11DpmsDisplayControl>(display.x11_display);
    if (backend == "command") return std::unexpected("display.sleep_command is empty");
    return std::unexpected("unknown display backend: " + backend);
}
