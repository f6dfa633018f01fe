#include "config.hpp"
#include "options.hpp"
#include "platform/linux/display_factory.hpp"
#include "platform/linux/linux_receiver_loop.hpp"
#include "platform/linux/tcp_listener.hpp"

#include <print>

static const OptionNames kOptionNames{
    .program = "display-sync-receiver",
    .address_flag = "--ip",
    .address_help = "Listen IP address",
    .payload_flag = "--signal",
    .payload_help = "Expected signal message",
    .address_default = "0.0.0.0",
    .payload_default = "sleep_display",
    .port_default = 12345,
};

int main(int argc, char* argv[]) {
    auto opts = parse_options(argc, argv, kOptionNames);

    if (opts.action == OptionsAction::Error) {
        std::println(stderr, "Error: {}", opts.error);
        print_usage(kOptionNames);
        return 1;
    }
    if (opts.action == OptionsAction::Help) {
        print_usage(kOptionNames);
        return 0;
    }
    if (!opts.had_args) {
        std::println("Note: no parameters specified, using default configuration");
        print_usage(kOptionNames);
        std::println("\nContinuing with default configuration...\n");
    }

    Config config = opts.config_path.empty() ? Config::load_default()
                                             : Config::load(opts.config_path);
    apply_receiver_options(opts, config);

    auto bind = config.receiver_bind();
    if (!bind) {
        std::println(stderr, "Error: {}", bind.error());
        return 1;
    }

    auto sleeper = make_display_sleeper(config.display);
    if (!sleeper) {
        std::println(stderr, "Error: {}", sleeper.error());
        return 1;
    }

    std::println("Configuration:");
    std::println("  Listen: {}", bind->to_string());
    std::println("  Expected signal: {}", config.receiver.signal);
    if (config.display.sleep_command.empty()) {
        std::println("  Display backend: {}", resolve_display_backend(config.display));
    } else {
        std::println("  Sleep command: {}", config.display.sleep_command.front());
    }
    std::println("Starting listener, press Control-C to terminate");

    TcpListener listener;
    LinuxReceiverLoop loop(std::move(config), std::move(*bind), listener, **sleeper, opts.verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to start listener");
        return 1;
    }

    loop.run();
    return 0;
}
