#include "peerchat/Types.hpp"

#include <arpa/inet.h>

#include <charconv>
#include <limits>

namespace peerchat {

std::optional<std::uint16_t> parse_port(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint32_t value = 0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto result = std::from_chars(begin, end, value);
    if (result.ec != std::errc{} || result.ptr != end) {
        return std::nullopt;
    }
    if (value == 0 || value > std::numeric_limits<std::uint16_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

std::optional<Endpoint> parse_endpoint(std::string_view text) {
    const auto colon = text.rfind(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::nullopt;
    }
    const auto port = parse_port(text.substr(colon + 1));
    if (!port.has_value()) {
        return std::nullopt;
    }
    return Endpoint{std::string(text.substr(0, colon)), *port};
}

std::string endpoint_to_string(const Endpoint& endpoint) {
    return endpoint.host + ':' + std::to_string(endpoint.port);
}

bool is_numeric_ipv4(std::string_view text) {
    if (text.empty() || text.size() > 15) {
        return false;
    }
    const std::string copy(text);
    in_addr parsed{};
    return ::inet_pton(AF_INET, copy.c_str(), &parsed) == 1;
}

}  // namespace peerchat
