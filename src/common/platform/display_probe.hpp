#pragma once

#include <expected>
#include <string>

class DisplayProbe {
public:
    virtual ~DisplayProbe() = default;
    // True if the local display is powered on.
    virtual std::expected<bool, std::string> is_display_on() = 0;
};
