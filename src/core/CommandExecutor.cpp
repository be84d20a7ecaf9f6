#include "peerchat/core/CommandExecutor.hpp"

#include "peerchat/core/Node.hpp"
#include "peerchat/log/StructuredLogger.hpp"
#include "peerchat/protocol/Message.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace peerchat {

namespace {

using log::StructuredLogger;

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

// Splits off the first whitespace-delimited word; the rest is returned trimmed.
std::pair<std::string_view, std::string_view> split_word(std::string_view text) {
    text = trim(text);
    std::size_t end = 0;
    while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) {
        ++end;
    }
    return {text.substr(0, end), trim(text.substr(end))};
}

CommandResponse ok(std::string message) {
    CommandResponse response{};
    response.message = std::move(message);
    return response;
}

CommandResponse failure(std::string code, std::string message) {
    CommandResponse response{};
    response.success = false;
    response.code = std::move(code);
    response.message = std::move(message);
    return response;
}

}  // namespace

CommandExecutor::CommandExecutor(Node& node)
    : node_(node) {}

std::pair<std::string, std::string> CommandExecutor::split_command_line(std::string_view line) {
    auto [name, rest] = split_word(line);
    if (!name.empty() && name.front() == '/') {
        name.remove_prefix(1);
    }
    return {std::string(name), std::string(rest)};
}

bool CommandExecutor::is_valid_display_name(std::string_view name) noexcept {
    return protocol::is_valid_identity_field(name);
}

CommandResponse CommandExecutor::execute(std::string_view name, std::string_view args) {
    name = trim(name);
    if (!name.empty() && name.front() == '/') {
        name.remove_prefix(1);
    }

    log::log_event(StructuredLogger::Level::Debug, "command.execute", {{"command", std::string(name)}});

    if (name == "help") {
        return help();
    }
    if (name == "quit") {
        auto response = ok("Goodbye");
        response.action = CommandAction::Quit;
        return response;
    }
    if (name == "clear") {
        auto response = ok({});
        response.action = CommandAction::ClearScreen;
        return response;
    }
    if (name == "history") {
        return history();
    }
    if (name == "users") {
        return users();
    }
    if (name == "peers") {
        return peers();
    }
    if (name == "whisper") {
        return whisper(args);
    }
    if (name == "connect") {
        return connect(args);
    }
    if (name == "disconnect") {
        return disconnect(args);
    }
    if (name == "name") {
        return rename(args);
    }
    return failure("E_UNKNOWN_COMMAND", "Unknown command: " + std::string(name) + " (try /help)");
}

CommandResponse CommandExecutor::help() const {
    auto response = ok("Available commands");
    response.lines = {
        "/connect <address:port>   probe a peer and join it",
        "/disconnect <address>     forget a peer",
        "/peers                    list known peers",
        "/users                    list users seen recently",
        "/whisper <name> <text>    send a private message",
        "/name <new name>          change your display name",
        "/history                  show recent chat history",
        "/clear                    clear the screen",
        "/help                     show this list",
        "/quit                     leave the chat",
    };
    return response;
}

CommandResponse CommandExecutor::history() const {
    auto response = ok("Recent history");
    response.lines = node_.history().tail(node_.config().history_tail_lines);
    if (response.lines.empty()) {
        response.message = "No chat history yet";
    }
    return response;
}

CommandResponse CommandExecutor::users() {
    const auto entries = node_.users();
    auto response = ok("Active users: " + std::to_string(entries.size()));
    for (const auto& entry : entries) {
        response.lines.push_back(entry.name + " (" + entry.address + ")" + (entry.is_self ? " [you]" : ""));
    }

    const auto self = node_.identity();
    node_.broadcast(protocol::PingPayload{self.name, self.address, node_.listening_port()});
    return response;
}

CommandResponse CommandExecutor::peers() const {
    const auto records = node_.peers();
    if (records.empty()) {
        return ok("No peers known yet (use /connect <address:port>)");
    }
    auto response = ok("Known peers: " + std::to_string(records.size()));
    for (const auto& record : records) {
        response.lines.push_back(endpoint_to_string(Endpoint{record.address, record.port}));
    }
    return response;
}

CommandResponse CommandExecutor::whisper(std::string_view args) {
    const auto [target, text] = split_word(args);
    if (target.empty() || text.empty()) {
        return failure("E_USAGE", "Usage: /whisper <name> <text>");
    }

    const std::string target_name(target);
    const auto address = node_.presence().resolve_address(target_name);
    if (!address.has_value()) {
        return failure("E_USER_NOT_FOUND", "User " + target_name + " is not online");
    }
    const auto port = node_.directory().port_of(*address);
    if (!port.has_value()) {
        return failure("E_NO_ROUTE", "No known port for " + target_name + " at " + *address);
    }

    const auto self = node_.identity();
    const std::string body(text);
    if (!node_.unicast(*address, *port, protocol::PrivatePayload{self.name, self.address, target_name, body})) {
        log::log_event(StructuredLogger::Level::Warning,
                       "whisper.send_failed",
                       {{"target", target_name}, {"address", *address}});
    }
    node_.history().append("[private to " + target_name + "] " + body);
    node_.emit(ChatEvent{ChatEvent::Kind::PrivateSent, target_name, *address, body});
    return ok("Private message sent to " + target_name);
}

CommandResponse CommandExecutor::connect(std::string_view args) {
    const auto [target, extra] = split_word(args);
    if (target.empty() || !extra.empty()) {
        return failure("E_USAGE", "Usage: /connect <address:port>");
    }

    const auto endpoint = parse_endpoint(target);
    if (!endpoint.has_value()) {
        return failure("E_INVALID_ENDPOINT", "Invalid address: " + std::string(target) + " (expected host:port)");
    }

    const auto label = endpoint_to_string(*endpoint);
    if (node_.directory().port_of(endpoint->host) == endpoint->port) {
        auto response = ok("Already connected to " + label);
        response.code = "ALREADY_CONNECTED";
        return response;
    }

    if (!node_.probe(*endpoint, node_.config().probe_timeout)) {
        return failure("E_PROBE_TIMEOUT", "No response from " + label);
    }

    const auto update = node_.directory().upsert(endpoint->host, endpoint->port);
    const auto self = node_.identity();
    node_.broadcast(protocol::JoinPayload{self.name, self.address});

    if (!update.persisted()) {
        return failure("E_STORAGE", "Connected to " + label + " but the peers file was not updated: " +
                                        *update.storage_error);
    }
    return ok("Connected to " + label);
}

CommandResponse CommandExecutor::disconnect(std::string_view args) {
    const auto address = std::string(trim(args));
    if (address.empty()) {
        return failure("E_USAGE", "Usage: /disconnect <address>");
    }

    const auto update = node_.directory().remove(address);
    if (!update.found) {
        return failure("E_PEER_NOT_FOUND", "Peer " + address + " is not in the peer list");
    }
    const auto dropped = node_.presence().remove_by_address(address);

    log::log_event(StructuredLogger::Level::Info,
                   "peer.disconnected",
                   {{"address", address}, {"presence_removed", std::to_string(dropped)}});

    if (!update.persisted()) {
        return failure("E_STORAGE", "Disconnected from " + address + " but the peers file was not updated: " +
                                        *update.storage_error);
    }
    return ok("Disconnected from " + address);
}

CommandResponse CommandExecutor::rename(std::string_view args) {
    const auto new_name = std::string(trim(args));
    if (new_name.empty()) {
        return failure("E_USAGE", "Usage: /name <new name>");
    }
    if (!is_valid_display_name(new_name)) {
        return failure("E_INVALID_NAME", "Names cannot contain spaces, ':' or control characters");
    }

    if (new_name == node_.display_name()) {
        return ok("You are already known as " + new_name);
    }

    const auto previous = node_.rename_self(new_name);
    node_.broadcast(protocol::RenamePayload{previous, new_name, node_.local_address()});
    return ok("You are now known as " + new_name);
}

}  // namespace peerchat
