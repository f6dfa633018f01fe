#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

struct Endpoint {
    std::string host;
    uint16_t port = 0;

    std::string to_string() const;
};

// Parse a decimal port string. The whole string must be a number in 1..65535.
std::expected<uint16_t, std::string> parse_port(std::string_view text);

// Range-check a port read from the config file.
std::expected<uint16_t, std::string> validate_port(int64_t port);
