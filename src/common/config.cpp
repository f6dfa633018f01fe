#include "config.hpp"

#include "platform/platform_paths.hpp"
#include "signal_message.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::expected<Endpoint, std::string> make_endpoint(const std::string& host, int port,
                                                   const std::string& payload) {
    if (host.empty()) {
        return std::unexpected("address must not be empty");
    }
    auto p = validate_port(port);
    if (!p) return std::unexpected(p.error());

    auto valid = signal_message::validate(payload);
    if (!valid) return std::unexpected(valid.error());

    return Endpoint{host, *p};
}

} // namespace

std::expected<Endpoint, std::string> Config::sender_target() const {
    if (sender.poll_interval_ms == 0) {
        return std::unexpected("sender.poll_interval_ms must be positive");
    }
    return make_endpoint(sender.host, sender.port, sender.content);
}

std::expected<Endpoint, std::string> Config::receiver_bind() const {
    return make_endpoint(receiver.ip, receiver.port, receiver.signal);
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("sender")) {
            auto& s = j["sender"];
            if (s.contains("host")) cfg.sender.host = s["host"].get<std::string>();
            if (s.contains("port")) cfg.sender.port = s["port"].get<int>();
            if (s.contains("content")) cfg.sender.content = s["content"].get<std::string>();
            if (s.contains("poll_interval_ms"))
                cfg.sender.poll_interval_ms = s["poll_interval_ms"].get<uint32_t>();
            if (s.contains("connect_timeout_ms"))
                cfg.sender.connect_timeout_ms = s["connect_timeout_ms"].get<uint32_t>();
        }

        if (j.contains("receiver")) {
            auto& r = j["receiver"];
            if (r.contains("ip")) cfg.receiver.ip = r["ip"].get<std::string>();
            if (r.contains("port")) cfg.receiver.port = r["port"].get<int>();
            if (r.contains("signal")) cfg.receiver.signal = r["signal"].get<std::string>();
            if (r.contains("rebind_retry_ms"))
                cfg.receiver.rebind_retry_ms = r["rebind_retry_ms"].get<uint32_t>();
        }

        if (j.contains("display")) {
            auto& d = j["display"];
            if (d.contains("backend")) cfg.display.backend = d["backend"].get<std::string>();
            if (d.contains("x11_display")) cfg.display.x11_display = d["x11_display"].get<std::string>();
            if (d.contains("sleep_command"))
                cfg.display.sleep_command = d["sleep_command"].get<std::vector<std::string>>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
