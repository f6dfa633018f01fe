#pragma once

#include "config.hpp"

#include <cstdint>
#include <optional>
#include <string>

// Flag names for one of the two programs. The port flag is always --port.
struct OptionNames {
    std::string program;
    std::string address_flag;     // "--host" or "--ip"
    std::string address_help;
    std::string payload_flag;     // "--content" or "--signal"
    std::string payload_help;
    std::string address_default;
    std::string payload_default;
    int port_default;
};

enum class OptionsAction { Run, Help, Error };

struct Options {
    OptionsAction action = OptionsAction::Run;
    std::string error;

    bool had_args = false;
    bool verbose = false;
    std::string config_path;

    std::optional<std::string> address;
    std::optional<uint16_t> port;
    std::optional<std::string> payload;
};

Options parse_options(int argc, char* argv[], const OptionNames& names);

void print_usage(const OptionNames& names);

// Overlay command-line values on top of a loaded config.
void apply_sender_options(const Options& opts, Config& config);
void apply_receiver_options(const Options& opts, Config& config);
