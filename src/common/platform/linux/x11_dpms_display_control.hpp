#pragma once

#include "platform/display_probe.hpp"
#include "platform/display_sleeper.hpp"

#include <expected>
#include <mutex>
#include <string>

struct _XDisplay;

// Display power through the X11 DPMS extension.
class X11DpmsDisplayControl : public DisplayProbe, public DisplaySleeper {
public:
    // Empty display_name uses $DISPLAY.
    explicit X11DpmsDisplayControl(std::string display_name = {});
    ~X11DpmsDisplayControl() override;

    X11DpmsDisplayControl(const X11DpmsDisplayControl&) = delete;
    X11DpmsDisplayControl& operator=(const X11DpmsDisplayControl&) = delete;

    std::expected<bool, std::string> is_display_on() override;
    std::expected<void, std::string> sleep_display() override;

private:
    std::expected<void, std::string> ensure_open();
    bool dpms_capable();

    // Drops a display whose server went away. Error if it did.
    std::expected<void, std::string> check_connection();

    // Xlib I/O exit handler; returning keeps the process alive.
    static void on_connection_lost(_XDisplay* dpy, void* self);

    std::mutex mtx_;
    std::string display_name_;
    _XDisplay* dpy_ = nullptr;
    bool connection_lost_ = false;
};
