#include "options.hpp"

#include <print>

Options parse_options(int argc, char* argv[], const OptionNames& names) {
    Options opts;

    auto fail = [&opts](std::string message) {
        opts.action = OptionsAction::Error;
        opts.error = std::move(message);
        return opts;
    };

    for (int i = 1; i < argc; i++) {
        opts.had_args = true;
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            opts.action = OptionsAction::Help;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (!has_value) return fail("missing value for " + arg);
            opts.config_path = argv[++i];
        } else if (arg == names.address_flag) {
            if (!has_value) return fail("missing value for " + arg);
            opts.address = argv[++i];
        } else if (arg == "--port") {
            if (!has_value) return fail("missing value for --port");
            auto port = parse_port(argv[++i]);
            if (!port) return fail(port.error());
            opts.port = *port;
        } else if (arg == names.payload_flag) {
            if (!has_value) return fail("missing value for " + arg);
            opts.payload = argv[++i];
        } else {
            return fail("unrecognized argument: " + arg);
        }
    }

    return opts;
}

void print_usage(const OptionNames& names) {
    std::println("Usage: {} [options]", names.program);
    std::println("Options:");
    std::println("  {:<10} <value>  {} (default: {})", names.address_flag, names.address_help,
                 names.address_default);
    std::println("  {:<10} <port>   Port number, 1-65535 (default: {})", "--port", names.port_default);
    std::println("  {:<10} <msg>    {} (default: {})", names.payload_flag, names.payload_help,
                 names.payload_default);
    std::println("  -c, --config PATH   Config file path");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -h, --help          Show this help");
}

void apply_sender_options(const Options& opts, Config& config) {
    if (opts.address) config.sender.host = *opts.address;
    if (opts.port) config.sender.port = *opts.port;
    if (opts.payload) config.sender.content = *opts.payload;
}

void apply_receiver_options(const Options& opts, Config& config) {
    if (opts.address) config.receiver.ip = *opts.address;
    if (opts.port) config.receiver.port = *opts.port;
    if (opts.payload) config.receiver.signal = *opts.payload;
}
