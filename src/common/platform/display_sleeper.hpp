#pragma once

#include <expected>
#include <string>

// Implementations must tolerate concurrent and repeated calls.
class DisplaySleeper {
public:
    virtual ~DisplaySleeper() = default;
    virtual std::expected<void, std::string> sleep_display() = 0;
};
