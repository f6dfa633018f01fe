#pragma once

#include "platform/display_sleeper.hpp"

#include <string>
#include <vector>

// Runs an external command (argv[0] looked up in $PATH) and waits for it.
class CommandDisplaySleeper : public DisplaySleeper {
public:
    explicit CommandDisplaySleeper(std::vector<std::string> argv);

    std::expected<void, std::string> sleep_display() override;

private:
    std::vector<std::string> argv_;
};
