#pragma once

#include "platform/display_probe.hpp"

#include <functional>
#include <optional>
#include <string>

// Edge detector over the display probe. Fires on_display_on once for each
// transition from off (or never observed) to on.
class ChangeDetector {
public:
    using EdgeCallback = std::function<void()>;

    ChangeDetector(DisplayProbe& probe, EdgeCallback on_display_on, bool verbose = false);

    // Sample the probe once. Returns true if the edge callback fired.
    bool tick();

    std::optional<bool> last_state() const { return last_state_; }

private:
    void log(const std::string& msg);

    DisplayProbe& probe_;
    EdgeCallback on_display_on_;
    bool verbose_;
    std::optional<bool> last_state_;
};
