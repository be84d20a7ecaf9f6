#include "peerchat/protocol/Message.hpp"

#include "peerchat/Types.hpp"

#include <type_traits>
#include <utility>

namespace peerchat::protocol {

namespace {

constexpr std::string_view kChatTag = "MSG";
constexpr std::string_view kSystemTag = "SYS";
constexpr std::string_view kPrivateTag = "PM";
constexpr std::string_view kJoinTag = "JOIN";
constexpr std::string_view kLeaveTag = "LEAVE";
constexpr std::string_view kPingTag = "PING";
constexpr std::string_view kActiveTag = "ACTIVE";
constexpr std::string_view kRenameTag = "RENAME";

// Walks a delimited line left to right. Fixed fields are consumed one at a
// time; the trailing text field takes everything that is left.
class FieldReader {
public:
    explicit FieldReader(std::string_view line) : rest_(line) {}

    std::optional<std::string_view> next() {
        if (exhausted_) {
            return std::nullopt;
        }
        const auto pos = rest_.find(kFieldDelimiter);
        if (pos == std::string_view::npos) {
            const auto field = rest_;
            rest_ = {};
            exhausted_ = true;
            return field;
        }
        const auto field = rest_.substr(0, pos);
        rest_.remove_prefix(pos + 1);
        return field;
    }

    std::optional<std::string_view> remainder() {
        if (exhausted_) {
            return std::nullopt;
        }
        const auto field = rest_;
        rest_ = {};
        exhausted_ = true;
        return field;
    }

private:
    std::string_view rest_;
    bool exhausted_{false};
};

std::string_view strip_line_terminator(std::string_view line) {
    if (!line.empty() && line.back() == '\n') {
        line.remove_suffix(1);
    }
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

void append_field(std::string& out, std::string_view field) {
    out.push_back(kFieldDelimiter);
    out.append(field);
}

std::optional<Message> decode_system(FieldReader& reader) {
    const auto subtype = reader.next();
    if (!subtype.has_value()) {
        return std::nullopt;
    }

    const auto name = reader.next();
    const auto second = reader.next();
    if (!name.has_value() || !second.has_value() || !is_valid_identity_field(*name) ||
        !is_valid_identity_field(*second)) {
        return std::nullopt;
    }

    if (*subtype == kJoinTag) {
        return Message{JoinPayload{std::string(*name), std::string(*second)}};
    }
    if (*subtype == kLeaveTag) {
        return Message{LeavePayload{std::string(*name), std::string(*second)}};
    }
    if (*subtype == kActiveTag) {
        return Message{ActivePayload{std::string(*name), std::string(*second)}};
    }
    if (*subtype == kPingTag) {
        PingPayload payload{std::string(*name), std::string(*second), std::nullopt};
        const auto port_field = reader.next();
        if (port_field.has_value() && !port_field->empty()) {
            const auto port = parse_port(*port_field);
            if (!port.has_value()) {
                return std::nullopt;
            }
            payload.reply_port = *port;
        }
        return Message{std::move(payload)};
    }
    if (*subtype == kRenameTag) {
        const auto address = reader.next();
        if (!address.has_value() || !is_valid_identity_field(*address)) {
            return std::nullopt;
        }
        return Message{RenamePayload{std::string(*name), std::string(*second), std::string(*address)}};
    }
    return std::nullopt;
}

}  // namespace

MessageType type_of(const Message& message) noexcept {
    return std::visit(
        [](const auto& payload) {
            using PayloadType = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<PayloadType, ChatPayload>) {
                return MessageType::Chat;
            } else if constexpr (std::is_same_v<PayloadType, JoinPayload>) {
                return MessageType::Join;
            } else if constexpr (std::is_same_v<PayloadType, LeavePayload>) {
                return MessageType::Leave;
            } else if constexpr (std::is_same_v<PayloadType, PingPayload>) {
                return MessageType::Ping;
            } else if constexpr (std::is_same_v<PayloadType, ActivePayload>) {
                return MessageType::Active;
            } else if constexpr (std::is_same_v<PayloadType, RenamePayload>) {
                return MessageType::Rename;
            } else {
                return MessageType::Private;
            }
        },
        message);
}

std::string_view tag_of(MessageType type) noexcept {
    switch (type) {
        case MessageType::Chat:
            return "MSG";
        case MessageType::Join:
            return "SYS:JOIN";
        case MessageType::Leave:
            return "SYS:LEAVE";
        case MessageType::Ping:
            return "SYS:PING";
        case MessageType::Active:
            return "SYS:ACTIVE";
        case MessageType::Rename:
            return "SYS:RENAME";
        case MessageType::Private:
            return "PM";
    }
    return "MSG";
}

SenderIdentity sender_of(const Message& message) {
    return std::visit(
        [](const auto& payload) -> SenderIdentity {
            using PayloadType = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<PayloadType, ChatPayload> ||
                          std::is_same_v<PayloadType, PrivatePayload>) {
                return SenderIdentity{payload.sender, payload.address};
            } else if constexpr (std::is_same_v<PayloadType, RenamePayload>) {
                return SenderIdentity{payload.new_name, payload.address};
            } else {
                return SenderIdentity{payload.name, payload.address};
            }
        },
        message);
}

bool is_wire_safe_field(std::string_view value) noexcept {
    for (const unsigned char ch : value) {
        if (ch == static_cast<unsigned char>(kFieldDelimiter) || ch < 0x20 || ch == 0x7F) {
            return false;
        }
    }
    return true;
}

bool is_valid_identity_field(std::string_view value) noexcept {
    if (value.empty() || !is_wire_safe_field(value)) {
        return false;
    }
    return value.find(' ') == std::string_view::npos;
}

std::optional<std::string> encode(const Message& message) {
    std::string out{tag_of(type_of(message))};
    out.reserve(64);
    bool valid = true;

    const auto identity = [&](std::string_view field) {
        valid = valid && is_valid_identity_field(field);
        append_field(out, field);
    };
    const auto text = [&](std::string_view field) {
        valid = valid && field.find_first_of("\r\n") == std::string_view::npos;
        append_field(out, field);
    };

    std::visit(
        [&](const auto& payload) {
            using PayloadType = std::decay_t<decltype(payload)>;

            if constexpr (std::is_same_v<PayloadType, ChatPayload>) {
                identity(payload.sender);
                identity(payload.address);
                text(payload.text);
            } else if constexpr (std::is_same_v<PayloadType, PingPayload>) {
                identity(payload.name);
                identity(payload.address);
                if (payload.reply_port.has_value()) {
                    valid = valid && *payload.reply_port != 0;
                    append_field(out, std::to_string(*payload.reply_port));
                }
            } else if constexpr (std::is_same_v<PayloadType, RenamePayload>) {
                identity(payload.old_name);
                identity(payload.new_name);
                identity(payload.address);
            } else if constexpr (std::is_same_v<PayloadType, PrivatePayload>) {
                identity(payload.sender);
                identity(payload.address);
                identity(payload.target_name);
                text(payload.text);
            } else {
                identity(payload.name);
                identity(payload.address);
            }
        },
        message);

    if (!valid) {
        return std::nullopt;
    }
    return out;
}

std::optional<Message> decode(std::string_view line) {
    FieldReader reader(strip_line_terminator(line));

    const auto tag = reader.next();
    if (!tag.has_value()) {
        return std::nullopt;
    }

    if (*tag == kSystemTag) {
        return decode_system(reader);
    }

    if (*tag == kChatTag) {
        const auto sender = reader.next();
        const auto address = reader.next();
        const auto text = reader.remainder();
        if (!sender.has_value() || !address.has_value() || !text.has_value() ||
            !is_valid_identity_field(*sender) || !is_valid_identity_field(*address)) {
            return std::nullopt;
        }
        return Message{ChatPayload{std::string(*sender), std::string(*address), std::string(*text)}};
    }

    if (*tag == kPrivateTag) {
        const auto sender = reader.next();
        const auto address = reader.next();
        const auto target = reader.next();
        const auto text = reader.remainder();
        if (!sender.has_value() || !address.has_value() || !target.has_value() || !text.has_value() ||
            !is_valid_identity_field(*sender) || !is_valid_identity_field(*address) ||
            !is_valid_identity_field(*target)) {
            return std::nullopt;
        }
        return Message{PrivatePayload{std::string(*sender),
                                      std::string(*address),
                                      std::string(*target),
                                      std::string(*text)}};
    }

    return std::nullopt;
}

}  // namespace peerchat::protocol
