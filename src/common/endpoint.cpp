#include "endpoint.hpp"

#include <charconv>
#include <format>

std::string Endpoint::to_string() const {
    // Bracket IPv6 literals so the port stays unambiguous
    if (host.find(':') != std::string::npos) {
        return std::format("[{}]:{}", host, port);
    }
    return std::format("{}:{}", host, port);
}

std::expected<uint16_t, std::string> parse_port(std::string_view text) {
    if (text.empty()) {
        return std::unexpected("port number not provided");
    }

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return std::unexpected(std::format("port {} must be between 1-65535", text));
    }
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected(std::format("invalid port number: {}", text));
    }
    return validate_port(value);
}

std::expected<uint16_t, std::string> validate_port(int64_t port) {
    if (port < 1 || port > 65535) {
        return std::unexpected(std::format("port {} must be between 1-65535", port));
    }
    return static_cast<uint16_t>(port);
}
