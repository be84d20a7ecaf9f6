#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace peerchat::protocol {

inline constexpr char kFieldDelimiter = ':';

enum class MessageType : std::uint8_t {
    Chat,
    Join,
    Leave,
    Ping,
    Active,
    Rename,
    Private,
};

struct ChatPayload {
    std::string sender;
    std::string address;
    std::string text;

    bool operator==(const ChatPayload&) const = default;
};

struct JoinPayload {
    std::string name;
    std::string address;

    bool operator==(const JoinPayload&) const = default;
};

struct LeavePayload {
    std::string name;
    std::string address;

    bool operator==(const LeavePayload&) const = default;
};

struct PingPayload {
    std::string name;
    std::string address;
    std::optional<std::uint16_t> reply_port{};

    bool operator==(const PingPayload&) const = default;
};

struct ActivePayload {
    std::string name;
    std::string address;

    bool operator==(const ActivePayload&) const = default;
};

struct RenamePayload {
    std::string old_name;
    std::string new_name;
    std::string address;

    bool operator==(const RenamePayload&) const = default;
};

struct PrivatePayload {
    std::string sender;
    std::string address;
    std::string target_name;
    std::string text;

    bool operator==(const PrivatePayload&) const = default;
};

using Message = std::variant<ChatPayload,
                             JoinPayload,
                             LeavePayload,
                             PingPayload,
                             ActivePayload,
                             RenamePayload,
                             PrivatePayload>;

struct SenderIdentity {
    std::string name;
    std::string address;
};

MessageType type_of(const Message& message) noexcept;
std::string_view tag_of(MessageType type) noexcept;

// Identity refreshed in the presence registry for every inbound message.
SenderIdentity sender_of(const Message& message);

// No delimiter and no control characters.
bool is_wire_safe_field(std::string_view value) noexcept;

// Names and addresses are positional fields: non-empty, wire safe and free of
// whitespace.
bool is_valid_identity_field(std::string_view value) noexcept;

// Returns std::nullopt when a name or address is not a valid identity field or
// a text field contains CR or LF. Every line it produces decodes back to the
// same message.
std::optional<std::string> encode(const Message& message);

// Returns std::nullopt for unknown tags, missing fields, invalid names or
// addresses, or an invalid reply port. A single trailing CR/LF is ignored.
std::optional<Message> decode(std::string_view line);

}  // namespace peerchat::protocol
