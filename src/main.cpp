#include "peerchat/Config.hpp"
#include "peerchat/Types.hpp"
#include "peerchat/config/ConfigFile.hpp"
#include "peerchat/core/CommandExecutor.hpp"
#include "peerchat/core/Node.hpp"
#include "peerchat/log/StructuredLogger.hpp"
#include "peerchat/protocol/Message.hpp"

#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <signal.h>

#ifndef PEERCHAT_VERSION
#define PEERCHAT_VERSION "v0.1.0"
#endif

namespace {

constexpr std::string_view kPeerchatVersion = PEERCHAT_VERSION;

struct GlobalOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> profile_name;
    std::optional<std::uint16_t> port;
    std::optional<std::string> name;
    std::optional<std::string> address;
    std::optional<std::string> peers_file;
    std::optional<std::string> history_file;
    std::optional<std::string> log_file;
    bool no_log{false};
};

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& code() const& {
        return code_;
    }

    const std::string& message() const& {
        return message_;
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

void print_error(const std::string& code, const std::string& message, const std::string& hint) {
    std::cerr << "Error [" << code << "]: " << message << std::endl;
    if (!hint.empty()) {
        std::cerr << "Hint: " << hint << std::endl;
    }
}

std::atomic<bool> g_run_loop{false};

extern "C" void signal_handler(int signal_code) {
    switch (signal_code) {
    case SIGINT:
    case SIGTERM:
        g_run_loop.store(false, std::memory_order_release);
        break;
    default:
        break;
    }
}

// No SA_RESTART: a signal interrupts the blocking stdin read so the loop can
// notice the shutdown request.
void install_termination_handlers() {
    auto install = [](int sig) {
        struct sigaction action{};
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(sig, &action, nullptr);
    };
    install(SIGINT);
    install(SIGTERM);
}

void uninstall_termination_handlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}

void print_usage() {
    std::cout << "peerchat " << kPeerchatVersion << " - serverless UDP chat\n"
              << "Usage: peerchat [options]\n\n"
              << "Options:\n"
              << "  -p, --port <port>        UDP port to listen on (default 12345)\n"
              << "  -n, --name <name>        display name (default $USER)\n"
              << "  -a, --address <ip>       address advertised to peers (default 127.0.0.1)\n"
              << "      --config <file>      YAML configuration file\n"
              << "      --profile <name>     profile to select from the configuration file\n"
              << "      --peers-file <path>  peer list storage (empty keeps it in memory)\n"
              << "      --history-file <path> chat history storage (empty keeps it in memory)\n"
              << "      --log-file <path>    structured log destination\n"
              << "      --no-log             disable logging\n"
              << "      --version            print the version and exit\n"
              << "  -h, --help               show this help\n\n"
              << "Type /help once running to list chat commands." << std::endl;
}

std::uint16_t parse_port_option(std::string_view option, const std::string& value) {
    const auto port = peerchat::parse_port(value);
    if (!port.has_value()) {
        throw_cli_error("E_INVALID_VALUE",
                        std::string(option) + " must be a port between 1 and 65535",
                        "Received '" + value + "'");
    }
    return *port;
}

GlobalOptions parse_options(const std::vector<std::string_view>& args, bool& exit_early) {
    GlobalOptions options{};
    std::size_t index = 0;

    auto require_value = [&](std::string_view option) -> std::string {
        if (index >= args.size()) {
            throw_cli_error("E_MISSING_VALUE",
                            std::string(option) + " requires a value",
                            "Provide an argument immediately after " + std::string(option));
        }
        return std::string(args[index++]);
    };

    while (index < args.size()) {
        const auto opt = args[index++];
        if (opt == "--help" || opt == "-h") {
            print_usage();
            exit_early = true;
            return options;
        }
        if (opt == "--version") {
            std::cout << "peerchat " << kPeerchatVersion << std::endl;
            exit_early = true;
            return options;
        }
        if (opt == "--port" || opt == "-p") {
            options.port = parse_port_option(opt, require_value(opt));
            continue;
        }
        if (opt == "--name" || opt == "-n") {
            auto name = require_value(opt);
            if (!peerchat::CommandExecutor::is_valid_display_name(name)) {
                throw_cli_error("E_INVALID_VALUE",
                                "Invalid display name: '" + name + "'",
                                "Names cannot contain spaces, ':' or control characters");
            }
            options.name = std::move(name);
            continue;
        }
        if (opt == "--address" || opt == "-a") {
            auto address = require_value(opt);
            if (!peerchat::protocol::is_valid_identity_field(address)) {
                throw_cli_error("E_INVALID_VALUE",
                                "Invalid advertised address: '" + address + "'",
                                "Use an IPv4 address or host name without ':'");
            }
            options.address = std::move(address);
            continue;
        }
        if (opt == "--config") {
            options.config_path = require_value(opt);
            continue;
        }
        if (opt == "--profile") {
            options.profile_name = require_value(opt);
            continue;
        }
        if (opt == "--peers-file") {
            options.peers_file = require_value(opt);
            continue;
        }
        if (opt == "--history-file") {
            options.history_file = require_value(opt);
            continue;
        }
        if (opt == "--log-file") {
            options.log_file = require_value(opt);
            continue;
        }
        if (opt == "--no-log") {
            options.no_log = true;
            continue;
        }
        throw_cli_error("E_UNKNOWN_OPTION",
                        "Unknown option: " + std::string(opt),
                        "Run 'peerchat --help' to see the supported options");
    }

    if (options.profile_name.has_value() && !options.config_path.has_value()) {
        throw_cli_error("E_MISSING_VALUE",
                        "--profile requires --config",
                        "Point --config at the file that defines the profile");
    }
    return options;
}

peerchat::Config build_config(const GlobalOptions& options) {
    auto config = peerchat::config::default_config();
    if (options.config_path.has_value()) {
        peerchat::config::load_config_file(*options.config_path, options.profile_name, config);
    }
    if (options.port) {
        config.listen_port = *options.port;
    }
    if (options.name) {
        config.display_name = *options.name;
    }
    if (options.address) {
        config.local_address = *options.address;
    }
    if (options.peers_file) {
        config.peers_file = *options.peers_file;
    }
    if (options.history_file) {
        config.history_file = *options.history_file;
    }
    if (options.log_file) {
        config.log_file = *options.log_file;
    }
    if (options.no_log) {
        config.log_enabled = false;
    }
    return config;
}

void configure_logging(const peerchat::Config& config) {
    auto& logger = peerchat::log::StructuredLogger::instance();
    logger.set_enabled(config.log_enabled);
    if (!config.log_enabled) {
        return;
    }
    if (const auto level = peerchat::log::StructuredLogger::parse_level(config.log_level)) {
        logger.set_min_level(*level);
    }
    if (!logger.set_file_sink(config.log_file)) {
        std::cerr << "Warning: cannot open log file " << config.log_file << "; logging disabled" << std::endl;
        logger.set_enabled(false);
    }
}

std::mutex g_output_mutex;

void render_event(const peerchat::ChatEvent& event) {
    using Kind = peerchat::ChatEvent::Kind;
    std::scoped_lock lock(g_output_mutex);
    switch (event.kind) {
    case Kind::Chat:
        std::cout << event.from << ": " << event.text << std::endl;
        break;
    case Kind::Private:
        std::cout << "[private] " << event.from << ": " << event.text << std::endl;
        break;
    case Kind::PrivateSent:
        std::cout << "[private to " << event.from << "] " << event.text << std::endl;
        break;
    case Kind::Joined:
        std::cout << "* " << event.from << " (" << event.address << ") joined the chat" << std::endl;
        break;
    case Kind::Left:
        std::cout << "* " << event.from << " (" << event.address << ") left the chat" << std::endl;
        break;
    case Kind::Renamed:
        std::cout << "* " << event.from << " is now known as " << event.text << std::endl;
        break;
    case Kind::Info:
        std::cout << "* " << event.text << std::endl;
        break;
    }
}

void render_response(const peerchat::CommandResponse& response) {
    std::scoped_lock lock(g_output_mutex);
    if (!response.success) {
        std::cout << "Error [" << response.code << "]: " << response.message << std::endl;
        return;
    }
    if (response.action == peerchat::CommandAction::ClearScreen) {
        std::cout << "\033[2J\033[H" << std::flush;
        return;
    }
    if (!response.message.empty()) {
        std::cout << response.message << std::endl;
    }
    for (const auto& line : response.lines) {
        std::cout << "  " << line << std::endl;
    }
}

int run_chat(const peerchat::Config& config) {
    peerchat::Node node(config);
    node.set_event_handler(render_event);

    try {
        node.start();
    } catch (const std::exception& ex) {
        print_error("E_BIND_FAILED", ex.what(), "Choose another port with --port");
        return 1;
    }

    {
        std::scoped_lock lock(g_output_mutex);
        std::cout << "peerchat " << kPeerchatVersion << ": " << node.display_name() << " listening on "
                  << node.local_address() << ":" << node.listening_port() << " ("
                  << node.peers().size() << " known peers). Type /help for commands." << std::endl;
    }

    g_run_loop.store(true, std::memory_order_release);
    install_termination_handlers();

    std::string line;
    while (g_run_loop.load(std::memory_order_acquire) && std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        if (line.front() != '/') {
            node.send_chat(line);
            continue;
        }
        const auto [name, args] = peerchat::CommandExecutor::split_command_line(line);
        const auto response = node.handle_command(name, args);
        render_response(response);
        if (response.action == peerchat::CommandAction::Quit) {
            break;
        }
    }

    uninstall_termination_handlers();
    node.shutdown();
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string_view> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        bool exit_early = false;
        const auto options = parse_options(args, exit_early);
        if (exit_early) {
            return 0;
        }

        const auto config = build_config(options);
        configure_logging(config);
        return run_chat(config);
    } catch (const CliException& ex) {
        print_error(ex.code(), ex.message(), ex.hint());
        return 1;
    } catch (const peerchat::config::ConfigError& ex) {
        print_error(ex.code, ex.message, ex.hint);
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return 1;
    }
}
