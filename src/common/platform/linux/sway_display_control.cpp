#include "platform/linux/sway_display_control.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

constexpr size_t MAGIC_SIZE = 6;
constexpr size_t HEADER_SIZE = MAGIC_SIZE + 2 * sizeof(uint32_t);

bool write_all(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t n = ::send(fd, data, size, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

bool read_all(int fd, char* data, size_t size) {
    while (size > 0) {
        ssize_t n = ::recv(fd, data, size, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace

SwayDisplayControl::SwayDisplayControl() = default;

SwayDisplayControl::~SwayDisplayControl() {
    disconnect();
}

std::expected<bool, std::string> SwayDisplayControl::is_display_on() {
    auto reply = request(MSG_GET_OUTPUTS, "");
    if (!reply) return std::unexpected(reply.error());
    return any_output_on(*reply);
}

std::expected<void, std::string> SwayDisplayControl::sleep_display() {
    auto reply = request(MSG_RUN_COMMAND, "output * power off");
    if (!reply) return std::unexpected(reply.error());
    return command_result(*reply);
}

bool SwayDisplayControl::any_output_on(const nlohmann::json& outputs) {
    if (!outputs.is_array()) return false;

    for (auto& output : outputs) {
        if (!output.is_object() || !output.value("active", false)) continue;
        // sway >= 1.8 reports "power", older releases "dpms"
        if (output.contains("power")) {
            if (output.value("power", false)) return true;
        } else if (output.value("dpms", false)) {
            return true;
        }
    }
    return false;
}

std::expected<void, std::string> SwayDisplayControl::command_result(const nlohmann::json& reply) {
    if (!reply.is_array() || reply.empty()) {
        return std::unexpected("sway: unexpected RUN_COMMAND reply");
    }
    for (auto& r : reply) {
        if (!r.is_object() || !r.value("success", false)) {
            std::string err = r.is_object() ? r.value("error", "unknown error") : "unknown error";
            return std::unexpected("sway: " + err);
        }
    }
    return {};
}

std::expected<nlohmann::json, std::string> SwayDisplayControl::request(uint32_t type,
                                                                      const std::string& payload) {
    std::lock_guard lock(mtx_);

    std::string failure;
    for (int attempt = 0; attempt < 2; attempt++) {
        if (fd_ < 0) {
            auto opened = open_socket();
            if (!opened) return std::unexpected(opened.error());
        }

        auto body = exchange(type, payload);
        if (!body) {
            // Sway restarted or dropped us; the second pass reconnects
            failure = body.error();
            disconnect();
            continue;
        }

        try {
            return nlohmann::json::parse(*body);
        } catch (const nlohmann::json::exception& e) {
            return std::unexpected(std::string("sway: bad reply: ") + e.what());
        }
    }
    return std::unexpected("sway: IPC request failed: " + failure);
}

std::expected<std::string, std::string> SwayDisplayControl::exchange(uint32_t type,
                                                                     const std::string& payload) {
    std::string frame(HEADER_SIZE + payload.size(), '\0');
    auto length = static_cast<uint32_t>(payload.size());
    std::memcpy(frame.data(), MAGIC, MAGIC_SIZE);
    std::memcpy(frame.data() + MAGIC_SIZE, &length, sizeof(length));
    std::memcpy(frame.data() + MAGIC_SIZE + sizeof(length), &type, sizeof(type));
    std::memcpy(frame.data() + HEADER_SIZE, payload.data(), payload.size());

    if (!write_all(fd_, frame.data(), frame.size())) {
        return std::unexpected(std::string("write failed: ") + std::strerror(errno));
    }

    char header[HEADER_SIZE];
    if (!read_all(fd_, header, sizeof(header))) {
        return std::unexpected("connection closed before reply");
    }
    if (std::memcmp(header, MAGIC, MAGIC_SIZE) != 0) {
        return std::unexpected("reply without i3-ipc magic");
    }

    uint32_t reply_length, reply_type;
    std::memcpy(&reply_length, header + MAGIC_SIZE, sizeof(reply_length));
    std::memcpy(&reply_type, header + MAGIC_SIZE + sizeof(reply_length), sizeof(reply_type));
    if (reply_type != type) {
        return std::unexpected(std::format("reply type {} for request {}", reply_type, type));
    }

    std::string body(reply_length, '\0');
    if (!read_all(fd_, body.data(), body.size())) {
        return std::unexpected("connection closed mid-reply");
    }
    return body;
}

std::expected<void, std::string> SwayDisplayControl::open_socket() {
    const char* path = std::getenv("SWAYSOCK");
    if (!path || !*path) {
        return std::unexpected("sway: IPC socket not available");
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (std::strlen(path) >= sizeof(addr.sun_path)) {
        return std::unexpected(std::string("sway: socket path too long: ") + path);
    }
    std::strcpy(addr.sun_path, path);

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return std::unexpected(std::string("sway: socket() failed: ") + std::strerror(errno));
    }
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string err = std::strerror(errno);
        ::close(fd);
        return std::unexpected(std::format("sway: cannot connect to {}: {}", path, err));
    }

    fd_ = fd;
    return {};
}

void SwayDisplayControl::disconnect() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}
