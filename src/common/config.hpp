#pragma once

#include "endpoint.hpp"
#include "signal_message.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

struct Config {
    struct Sender {
        std::string host = "127.0.0.1";
        int port = 12345;
        std::string content = signal_message::DEFAULT_PAYLOAD;
        uint32_t poll_interval_ms = 1000;
        uint32_t connect_timeout_ms = 5000;
    } sender;

    struct Receiver {
        std::string ip = "0.0.0.0";
        int port = 12345;
        std::string signal = signal_message::DEFAULT_PAYLOAD;
        uint32_t rebind_retry_ms = 1000;
    } receiver;

    struct Display {
        std::string backend = "auto"; // "auto", "sway", "x11" or "command"
        std::string x11_display;      // empty means $DISPLAY
        std::vector<std::string> sleep_command;
    } display;

    // Check the values the sender depends on and build its target endpoint.
    std::expected<Endpoint, std::string> sender_target() const;

    // Check the values the receiver depends on and build its bind endpoint.
    std::expected<Endpoint, std::string> receiver_bind() const;

    static Config load(const std::string& path);
    static Config load_default();
};
