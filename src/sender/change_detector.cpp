#include "change_detector.hpp"

#include <print>

ChangeDetector::ChangeDetector(DisplayProbe& probe, EdgeCallback on_display_on, bool verbose)
    : probe_(probe), on_display_on_(std::move(on_display_on)), verbose_(verbose) {}

bool ChangeDetector::tick() {
    bool current = false;
    auto reading = probe_.is_display_on();
    if (reading) {
        current = *reading;
    } else {
        // Treat as off so a broken probe never produces a sleep signal
        std::println(stderr, "probe: {}", reading.error());
    }

    if (last_state_ == current) return false;

    log(std::string("Display state changed: ") + (current ? "On" : "Off"));
    last_state_ = current;

    if (!current) return false;

    log("Sending display-on signal");
    on_display_on_();
    return true;
}

void ChangeDetector::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[display-sync-sender] {}", msg);
    }
}
