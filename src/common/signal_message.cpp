#include "signal_message.hpp"

#include <cstdint>
#include <format>

namespace signal_message {

bool is_valid_utf8(std::string_view bytes) {
    size_t i = 0;
    const size_t n = bytes.size();

    while (i < n) {
        auto c = static_cast<uint8_t>(bytes[i]);

        if (c < 0x80) {
            i++;
            continue;
        }

        size_t len;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + len > n) return false;

        for (size_t k = 1; k < len; k++) {
            auto cc = static_cast<uint8_t>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong encodings
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false;
        }
        if (cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;

        i += len;
    }
    return true;
}

std::expected<void, std::string> validate(std::string_view payload) {
    if (payload.empty()) {
        return std::unexpected("signal message must not be empty");
    }
    if (payload.size() > MAX_BYTES) {
        return std::unexpected(std::format("signal message is {} bytes, limit is {}",
                                           payload.size(), MAX_BYTES));
    }
    if (!is_valid_utf8(payload)) {
        return std::unexpected("signal message is not valid UTF-8");
    }
    return {};
}

} // namespace signal_message
