#pragma once

#include "config.hpp"
#include "platform/display_probe.hpp"
#include "platform/display_sleeper.hpp"

#include <expected>
#include <memory>
#include <string>

// Resolve "auto" to "sway" or "x11" depending on the session.
std::string resolve_display_backend(const Config::Display& display);

std::expected<std::unique_ptr<DisplayProbe>, std::string>
make_display_probe(const Config::Display& display);

std::expected<std::unique_ptr<DisplaySleeper>, std::string>
make_display_sleeper(const Config::Display& display);
