#include "config.hpp"
#include "options.hpp"
#include "platform/linux/display_factory.hpp"
#include "platform/linux/linux_sender_loop.hpp"

#include <print>

static const OptionNames kOptionNames{
    .program = "display-sync-sender",
    .address_flag = "--host",
    .address_help = "Target host IP address",
    .payload_flag = "--content",
    .payload_help = "Message content to send",
    .address_default = "127.0.0.1",
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
    apply_sender_options(opts, config);

    auto target = config.sender_target();
    if (!target) {
        std::println(stderr, "Error: {}", target.error());
        return 1;
    }

    auto probe = make_display_probe(config.display);
    if (!probe) {
        std::println(stderr, "Error: {}", probe.error());
        return 1;
    }

    std::println("Configuration:");
    std::println("  Target: {}", target->to_string());
    std::println("  Message content: {}", config.sender.content);
    std::println("  Display backend: {}", resolve_display_backend(config.display));
    std::println("  Poll interval: {} ms", config.sender.poll_interval_ms);
    std::println("Monitoring display state, press Control-C to terminate");

    LinuxSenderLoop loop(std::move(config), std::move(*target), **probe, opts.verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
