#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace signal_message {

// Upper bound for a payload, and the receive chunk size on the listener side.
constexpr size_t MAX_BYTES = 1024;

constexpr char DEFAULT_PAYLOAD[] = "sleep_display";

// Strict UTF-8 check: rejects overlong forms, surrogates and code points above U+10FFFF.
bool is_valid_utf8(std::string_view bytes);

// A payload must be non-empty UTF-8 of at most MAX_BYTES bytes.
std::expected<void, std::string> validate(std::string_view payload);

} // namespace signal_message
