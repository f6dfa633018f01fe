#pragma once

#include "platform/display_probe.hpp"
#include "platform/display_sleeper.hpp"

#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

// Display power through the Sway (i3-ipc) socket named by $SWAYSOCK.
class SwayDisplayControl : public DisplayProbe, public DisplaySleeper {
public:
    SwayDisplayControl();
    ~SwayDisplayControl() override;

    SwayDisplayControl(const SwayDisplayControl&) = delete;
    SwayDisplayControl& operator=(const SwayDisplayControl&) = delete;

    std::expected<bool, std::string> is_display_on() override;
    std::expected<void, std::string> sleep_display() override;

    // Any active output with power (or legacy dpms) on counts as "on".
    static bool any_output_on(const nlohmann::json& outputs);

    // Collapse a RUN_COMMAND reply into success or the first error.
    static std::expected<void, std::string> command_result(const nlohmann::json& reply);

private:
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr uint32_t MSG_RUN_COMMAND = 0;
    static constexpr uint32_t MSG_GET_OUTPUTS = 3;

    // Send one request and read its reply, reconnecting once if the socket went stale.
    std::expected<nlohmann::json, std::string> request(uint32_t type, const std::string& payload);

    // One framed round trip on the open socket. Returns the reply body.
    std::expected<std::string, std::string> exchange(uint32_t type, const std::string& payload);

    std::expected<void, std::string> open_socket();
    void disconnect();

    std::mutex mtx_;
    int fd_ = -1;
};
