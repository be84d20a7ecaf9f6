#include "peerchat/protocol/Message.hpp"

#include <cassert>
#include <string>
#include <type_traits>
#include <variant>

using namespace peerchat::protocol;

namespace {

void round_trip(const Message& message) {
    const auto encoded = encode(message);
    assert(encoded.has_value());
    assert(encoded->find('\n') == std::string::npos);
    const auto decoded = decode(*encoded);
    assert(decoded.has_value());
    assert(decoded->index() == message.index());
    assert(*decoded == message);
    assert(type_of(*decoded) == type_of(message));
}

template <typename Payload>
Payload expect(const std::optional<Message>& message) {
    assert(message.has_value());
    const auto* payload = std::get_if<Payload>(&*message);
    assert(payload != nullptr);
    return *payload;
}

}  // namespace

int main() {
    round_trip(ChatPayload{"alice", "10.0.0.1", "hello world"});
    round_trip(ChatPayload{"alice", "10.0.0.1", ""});
    round_trip(JoinPayload{"bob", "10.0.0.2"});
    round_trip(LeavePayload{"bob", "10.0.0.2"});
    round_trip(PingPayload{"carol", "10.0.0.3", std::nullopt});
    round_trip(PingPayload{"carol", "10.0.0.3", 12345});
    round_trip(ActivePayload{"dave", "10.0.0.4"});
    round_trip(RenamePayload{"dave", "david", "10.0.0.4"});
    round_trip(PrivatePayload{"erin", "10.0.0.5", "frank", "psst"});

    // Text fields keep embedded delimiters verbatim.
    round_trip(ChatPayload{"alice", "10.0.0.1", "time is 12:30:15 ok"});
    round_trip(PrivatePayload{"erin", "10.0.0.5", "frank", "a:b::c:"});

    assert(encode(ChatPayload{"alice", "10.0.0.1", "hi:there"}) == "MSG:alice:10.0.0.1:hi:there");
    assert(encode(JoinPayload{"bob", "10.0.0.2"}) == "SYS:JOIN:bob:10.0.0.2");
    assert(encode(PingPayload{"carol", "10.0.0.3", 9000}) == "SYS:PING:carol:10.0.0.3:9000");
    assert(encode(PingPayload{"carol", "10.0.0.3", std::nullopt}) == "SYS:PING:carol:10.0.0.3");
    assert(encode(RenamePayload{"a", "b", "10.0.0.9"}) == "SYS:RENAME:a:b:10.0.0.9");
    assert(encode(PrivatePayload{"erin", "10.0.0.5", "frank", "x"}) == "PM:erin:10.0.0.5:frank:x");

    // Line-oriented peers terminate datagrams with a newline.
    const auto& chat = expect<ChatPayload>(decode("MSG:alice:10.0.0.1:hello\r\n"));
    assert(chat.text == "hello");
    const auto& join = expect<JoinPayload>(decode("SYS:JOIN:bob:10.0.0.2\n"));
    assert(join.name == "bob");
    assert(join.address == "10.0.0.2");

    // Empty or absent reply port means "no port"; a non-numeric one is invalid.
    assert(!expect<PingPayload>(decode("SYS:PING:carol:10.0.0.3:")).reply_port.has_value());
    assert(expect<PingPayload>(decode("SYS:PING:carol:10.0.0.3:4000")).reply_port == 4000);
    assert(!decode("SYS:PING:carol:10.0.0.3:port").has_value());
    assert(!decode("SYS:PING:carol:10.0.0.3:0").has_value());
    assert(!decode("SYS:PING:carol:10.0.0.3:70000").has_value());

    // Fewer fields than the tag requires.
    assert(!decode("").has_value());
    assert(!decode("MSG").has_value());
    assert(!decode("MSG:alice").has_value());
    assert(!decode("MSG:alice:10.0.0.1").has_value());
    assert(!decode("SYS").has_value());
    assert(!decode("SYS:JOIN").has_value());
    assert(!decode("SYS:JOIN:bob").has_value());
    assert(!decode("SYS:RENAME:old:new").has_value());
    assert(!decode("PM:erin:10.0.0.5:frank").has_value());

    // Unknown tags.
    assert(!decode("HELLO:alice:10.0.0.1").has_value());
    assert(!decode("SYS:SHOUT:alice:10.0.0.1").has_value());
    assert(!decode("msg:alice:10.0.0.1:lowercase").has_value());

    const auto& rename = expect<RenamePayload>(decode("SYS:RENAME:old:new:10.0.0.7"));
    assert(rename.old_name == "old");
    assert(rename.new_name == "new");
    assert(rename.address == "10.0.0.7");

    const auto& pm = expect<PrivatePayload>(decode("PM:erin:10.0.0.5:frank:meet at 10:00"));
    assert(pm.target_name == "frank");
    assert(pm.text == "meet at 10:00");

    assert(sender_of(RenamePayload{"old", "new", "10.0.0.7"}).name == "new");
    assert(sender_of(PrivatePayload{"erin", "10.0.0.5", "frank", "x"}).name == "erin");
    assert(sender_of(PingPayload{"carol", "10.0.0.3", std::nullopt}).address == "10.0.0.3");

    assert(tag_of(MessageType::Active) == "SYS:ACTIVE");
    assert(is_wire_safe_field("alice"));
    assert(is_wire_safe_field("192.168.1.20"));
    assert(!is_wire_safe_field("a:b"));
    assert(!is_wire_safe_field("line\nbreak"));

    assert(is_valid_identity_field("lab-alice"));
    assert(!is_valid_identity_field(""));
    assert(!is_valid_identity_field("two words"));
    assert(!is_valid_identity_field("tab\there"));

    // Fields that could not be read back are refused at encode time.
    assert(!encode(ChatPayload{"a:b", "10.0.0.1", "hi"}).has_value());
    assert(!encode(ChatPayload{"alice", "10.0.0.1", "trailing\n"}).has_value());
    assert(!encode(ChatPayload{"alice", "10.0.0.1", "trailing\r"}).has_value());
    assert(!encode(ChatPayload{"alice", "10.0.0.1", "two\nlines"}).has_value());
    assert(!encode(JoinPayload{"", "10.0.0.2"}).has_value());
    assert(!encode(JoinPayload{"bob", ""}).has_value());
    assert(!encode(ActivePayload{"bob", "evil host"}).has_value());
    assert(!encode(PingPayload{"carol", "10.0.0.3", 0}).has_value());
    assert(!encode(RenamePayload{"dave", "da vid", "10.0.0.4"}).has_value());
    assert(!encode(PrivatePayload{"erin", "10.0.0.5", "fr:ank", "x"}).has_value());

    // Inbound names and addresses get the same checks.
    assert(!decode("SYS:JOIN:eve:").has_value());
    assert(!decode("SYS:JOIN::10.0.0.6").has_value());
    assert(!decode("SYS:ACTIVE:eve:evil host").has_value());
    assert(!decode("SYS:LEAVE:eve:10.0.0.6\x01").has_value());
    assert(!decode("SYS:RENAME:a:b c:10.0.0.1").has_value());
    assert(!decode("SYS:RENAME:a:b:").has_value());
    assert(!decode("MSG::10.0.0.1:x").has_value());
    assert(!decode("MSG:alice::x").has_value());
    assert(!decode("PM:a:10.0.0.1:two words:x").has_value());
    assert(!decode("PM:a:10.0.0.1::x").has_value());
    assert(expect<JoinPayload>(decode("SYS:JOIN:eve:chat.example.com")).address == "chat.example.com");

    return 0;
}
