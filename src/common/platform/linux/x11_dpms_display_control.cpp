#include "platform/linux/x11_dpms_display_control.hpp"

#include <print>

extern "C" {
#include <X11/Xlib.h>
#include <X11/extensions/dpms.h>
}

namespace {

std::once_flag handlers_installed;

// Xlib's defaults call exit(); log instead and let the caller see the failure.
int log_x_error(Display*, XErrorEvent* ev) {
    std::println(stderr, "x11: request {} failed with error {}", static_cast<int>(ev->request_code),
                 static_cast<int>(ev->error_code));
    return 0;
}

int log_io_error(Display*) {
    std::println(stderr, "x11: connection to X server lost");
    return 0;
}

} // namespace

X11DpmsDisplayControl::X11DpmsDisplayControl(std::string display_name)
    : display_name_(std::move(display_name)) {}

X11DpmsDisplayControl::~X11DpmsDisplayControl() {
    if (dpy_) XCloseDisplay(dpy_);
}

std::expected<bool, std::string> X11DpmsDisplayControl::is_display_on() {
    std::lock_guard lock(mtx_);

    auto open = ensure_open();
    if (!open) return std::unexpected(open.error());

    bool capable = dpms_capable();
    CARD16 state = 0;
    BOOL enabled = False;
    bool queried = capable && DPMSInfo(dpy_, &state, &enabled);

    if (auto alive = check_connection(); !alive) return std::unexpected(alive.error());
    if (!capable) return std::unexpected("x11: display does not support DPMS");
    if (!queried) return std::unexpected("x11: DPMSInfo failed");

    return !(enabled && state == DPMSModeOff);
}

std::expected<void, std::string> X11DpmsDisplayControl::sleep_display() {
    std::lock_guard lock(mtx_);

    auto open = ensure_open();
    if (!open) return std::unexpected(open.error());

    bool capable = dpms_capable();
    bool forced = false;
    if (capable) {
        // DPMSForceLevel is ignored while DPMS is disabled
        DPMSEnable(dpy_);
        forced = DPMSForceLevel(dpy_, DPMSModeOff);
        XFlush(dpy_);
    }

    if (auto alive = check_connection(); !alive) return std::unexpected(alive.error());
    if (!capable) return std::unexpected("x11: display does not support DPMS");
    if (!forced) return std::unexpected("x11: DPMSForceLevel failed");
    return {};
}

std::expected<void, std::string> X11DpmsDisplayControl::ensure_open() {
    if (dpy_) return {};

    std::call_once(handlers_installed, [] {
        XSetErrorHandler(log_x_error);
        XSetIOErrorHandler(log_io_error);
    });

    dpy_ = XOpenDisplay(display_name_.empty() ? nullptr : display_name_.c_str());
    if (!dpy_) {
        const char* name = display_name_.empty() ? XDisplayName(nullptr) : display_name_.c_str();
        return std::unexpected(std::string("x11: cannot open display ") + (name ? name : ""));
    }

    // Without this Xlib exits the process when the server goes away
    connection_lost_ = false;
    XSetIOErrorExitHandler(dpy_, &X11DpmsDisplayControl::on_connection_lost, this);
    return {};
}

std::expected<void, std::string> X11DpmsDisplayControl::check_connection() {
    if (!connection_lost_) return {};

    // The next call reconnects
    XCloseDisplay(dpy_);
    dpy_ = nullptr;
    connection_lost_ = false;
    return std::unexpected("x11: lost connection to display");
}

void X11DpmsDisplayControl::on_connection_lost(_XDisplay*, void* self) {
    static_cast<X11DpmsDisplayControl*>(self)->connection_lost_ = true;
}

bool X11DpmsDisplayControl::dpms_capable() {
    int dummy;
    return DPMSQueryExtension(dpy_, &dummy, &dummy) && DPMSCapable(dpy_);
}
