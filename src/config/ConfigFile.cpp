#include "peerchat/config/ConfigFile.hpp"

#include "peerchat/core/CommandExecutor.hpp"
#include "peerchat/log/StructuredLogger.hpp"
#include "peerchat/protocol/Message.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

namespace peerchat::config {

namespace {

std::string trim_left(std::string value) {
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch) {
                    return !std::isspace(ch);
                }));
    return value;
}

std::string trim_right(std::string value) {
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch) {
                    return !std::isspace(ch);
                }).base(),
                value.end());
    return value;
}

std::string trim_copy(const std::string& value) {
    return trim_right(trim_left(value));
}

std::string unescape_double_quoted(const std::string& inner) {
    std::string result;
    result.reserve(inner.size());
    for (std::size_t i = 0; i < inner.size(); ++i) {
        const char ch = inner[i];
        if (ch != '\\') {
            result.push_back(ch);
            continue;
        }
        if (i + 1 >= inner.size()) {
            throw ConfigError("E_CONFIG_PARSE", "Incomplete escape sequence in YAML string");
        }
        const char escaped = inner[++i];
        switch (escaped) {
            case '"':
            case '\\':
            case '/':
                result.push_back(escaped);
                break;
            case 'n':
                result.push_back('\n');
                break;
            case 't':
                result.push_back('\t');
                break;
            default:
                throw ConfigError("E_CONFIG_PARSE", std::string("Unsupported escape sequence \\") + escaped +
                                                        " in YAML string");
        }
    }
    return result;
}

Value parse_yaml_scalar(const std::string& text) {
    const std::string trimmed = trim_copy(text);
    if (trimmed.empty()) {
        return Value();
    }
    if (trimmed.size() >= 2 &&
        ((trimmed.front() == '"' && trimmed.back() == '"') || (trimmed.front() == '\'' && trimmed.back() == '\''))) {
        std::string inner = trimmed.substr(1, trimmed.size() - 2);
        if (trimmed.front() == '\'') {
            return Value(std::move(inner));
        }
        return Value(unescape_double_quoted(inner));
    }
    if (trimmed == "true" || trimmed == "True") {
        return Value(true);
    }
    if (trimmed == "false" || trimmed == "False") {
        return Value(false);
    }
    if (trimmed == "null" || trimmed == "~") {
        return Value();
    }

    std::size_t index = (trimmed[0] == '-' || trimmed[0] == '+') ? 1 : 0;
    const bool is_number = index < trimmed.size() &&
                           std::all_of(trimmed.begin() + static_cast<std::ptrdiff_t>(index), trimmed.end(),
                                       [](unsigned char ch) { return std::isdigit(ch) != 0; });
    if (is_number) {
        std::int64_t value{};
        const char* begin = trimmed.data() + (trimmed[0] == '+' ? 1 : 0);
        auto result = std::from_chars(begin, trimmed.data() + trimmed.size(), value);
        if (result.ec == std::errc{} && result.ptr == trimmed.data() + trimmed.size()) {
            return Value(value);
        }
    }
    return Value(trimmed);
}

const Value* find_path(const Value& root, const std::vector<std::string>& path) {
    const Value* node = &root;
    for (const auto& segment : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        const auto it = node->as_object().find(segment);
        if (it == node->as_object().end()) {
            return nullptr;
        }
        node = &it->second;
    }
    return node;
}

Value remove_key(const Value& object, const std::string& key) {
    if (!object.is_object()) {
        return object;
    }
    Value filtered = Value::make_object();
    for (const auto& [k, v] : object.as_object()) {
        if (k == key) {
            continue;
        }
        filtered.as_object()[k] = v;
    }
    return filtered;
}

std::string join_path(const std::vector<std::string>& path) {
    if (path.empty()) {
        return "<root>";
    }
    std::string combined;
    for (std::size_t i = 0; i < path.size(); ++i) {
        combined += path[i];
        if (i + 1 < path.size()) {
            combined += '.';
        }
    }
    return combined;
}

Value resolve_profile(const Value& profiles, const std::string& profile_name, std::set<std::string>& visiting) {
    if (!profiles.is_object()) {
        throw ConfigError("E_CONFIG_TYPE", "'profiles' section must be a mapping");
    }
    const auto it = profiles.as_object().find(profile_name);
    if (it == profiles.as_object().end()) {
        std::string names;
        for (const auto& [name, _] : profiles.as_object()) {
            if (!names.empty()) {
                names += ", ";
            }
            names += name;
        }
        throw ConfigError("E_CONFIG_PROFILE",
                          "Profile not found: " + profile_name,
                          "Available profiles: " + (names.empty() ? std::string{"<none>"} : names));
    }
    if (!it->second.is_object()) {
        throw ConfigError("E_CONFIG_TYPE", "Profile must be a mapping: " + profile_name);
    }
    if (visiting.contains(profile_name)) {
        throw ConfigError("E_CONFIG_PROFILE", "Profile inheritance cycle detected at " + profile_name);
    }
    visiting.insert(profile_name);

    Value result = Value::make_object();
    const auto extends_it = it->second.as_object().find("extends");
    if (extends_it != it->second.as_object().end()) {
        if (!extends_it->second.is_string()) {
            throw ConfigError("E_CONFIG_PROFILE", "'extends' must be a string in profile " + profile_name);
        }
        result = resolve_profile(profiles, extends_it->second.string_value, visiting);
    }

    result = merge_objects(result, remove_key(it->second, "extends"));
    visiting.erase(profile_name);
    return result;
}

std::uint16_t require_port(std::int64_t value, const char* key) {
    if (value <= 0 || value > std::numeric_limits<std::uint16_t>::max()) {
        throw ConfigError("E_CONFIG_VALUE", std::string(key) + " must be between 1 and 65535");
    }
    return static_cast<std::uint16_t>(value);
}

std::int64_t require_positive(std::int64_t value, const char* key) {
    if (value <= 0) {
        throw ConfigError("E_CONFIG_VALUE", std::string(key) + " must be greater than zero");
    }
    return value;
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    return value;
}

}  // namespace

Value parse_yaml(const std::string& text) {
    Value root = Value::make_object();
    struct Context {
        std::size_t indent;
        Value* node;
    };
    std::vector<Context> stack;
    stack.push_back({0, &root});

    std::istringstream input(text);
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        std::string trimmed_line = trim_right(line);
        std::size_t comment_pos = std::string::npos;
        bool in_single = false;
        bool in_double = false;
        for (std::size_t i = 0; i < trimmed_line.size(); ++i) {
            const char ch = trimmed_line[i];
            if (ch == '"' && !in_single) {
                in_double = !in_double;
            } else if (ch == '\'' && !in_double) {
                in_single = !in_single;
            } else if (ch == '#' && !in_single && !in_double) {
                comment_pos = i;
                break;
            }
        }
        if (comment_pos != std::string::npos) {
            trimmed_line = trim_right(trimmed_line.substr(0, comment_pos));
        }
        if (trimmed_line.empty()) {
            continue;
        }

        std::size_t indent = 0;
        while (indent < trimmed_line.size() && trimmed_line[indent] == ' ') {
            ++indent;
        }
        if (indent % 2 != 0) {
            throw ConfigError("E_CONFIG_PARSE",
                              "YAML indentation must be multiples of two spaces (line " +
                                  std::to_string(line_number) + ")");
        }
        const std::string content = trimmed_line.substr(indent);

        while (!stack.empty() && indent < stack.back().indent) {
            stack.pop_back();
        }
        if (stack.empty() || indent != stack.back().indent) {
            throw ConfigError("E_CONFIG_PARSE",
                              "Invalid indentation in YAML config (line " + std::to_string(line_number) + ")");
        }
        if (content.front() == '-') {
            throw ConfigError("E_CONFIG_PARSE",
                              "YAML sequences are not supported (line " + std::to_string(line_number) + ")");
        }

        const auto colon = content.find(':');
        if (colon == std::string::npos) {
            throw ConfigError("E_CONFIG_PARSE",
                              "Expected ':' in YAML mapping entry (line " + std::to_string(line_number) + ")");
        }
        const std::string key = trim_copy(content.substr(0, colon));
        const std::string value_part = trim_copy(content.substr(colon + 1));
        if (key.empty()) {
            throw ConfigError("E_CONFIG_PARSE", "Empty key in YAML mapping (line " + std::to_string(line_number) + ")");
        }

        auto& object = stack.back().node->ensure_object();
        if (value_part.empty()) {
            Value& child = object[key];
            if (!child.is_object()) {
                child = Value::make_object();
            }
            stack.push_back({indent + 2, &child});
        } else {
            object[key] = parse_yaml_scalar(value_part);
        }
    }

    return root;
}

Value load_document(const std::filesystem::path& path) {
    const auto absolute = std::filesystem::absolute(path);
    std::ifstream input(absolute);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND",
                          "Configuration file not found: " + absolute.string(),
                          "Verify the path or provide an absolute path");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return parse_yaml(buffer.str());
}

Value merge_objects(const Value& base, const Value& overlay) {
    if (!overlay.is_object()) {
        return overlay;
    }
    Value result = base;
    if (!result.is_object()) {
        result = Value::make_object();
    }
    for (const auto& [key, value] : overlay.as_object()) {
        if (value.is_object() && result.as_object().contains(key) && result.as_object()[key].is_object()) {
            result.as_object()[key] = merge_objects(result.as_object()[key], value);
        } else {
            result.as_object()[key] = value;
        }
    }
    return result;
}

Value resolve_profile(const Value& profiles, const std::string& profile_name) {
    std::set<std::string> visiting;
    return resolve_profile(profiles, profile_name, visiting);
}

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_string()) {
        return node->string_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected string at config path " + join_path(path));
}

std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_boolean()) {
        return node->boolean_value;
    }
    if (node->is_string()) {
        std::string lowered = node->string_value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (lowered == "yes" || lowered == "on") {
            return true;
        }
        if (lowered == "no" || lowered == "off") {
            return false;
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected boolean at config path " + join_path(path));
}

std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_integer()) {
        return node->integer_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected integer at config path " + join_path(path));
}

Config default_config() {
    Config config{};
    const auto user = env_or("USER", "anonymous");
    if (CommandExecutor::is_valid_display_name(user)) {
        config.display_name = user;
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        const std::filesystem::path home_dir(home);
        config.peers_file = (home_dir / ".chat_peers").string();
        config.history_file = (home_dir / ".chat_history").string();
    }
    config.log_file = "/tmp/chat_" + user + ".log";
    return config;
}

void apply_document(const Value& document, const std::optional<std::string>& profile, Config& config) {
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_TYPE", "Configuration root must be a mapping");
    }

    Value effective = remove_key(document, "profiles");
    if (profile.has_value()) {
        const auto profiles_it = document.as_object().find("profiles");
        if (profiles_it == document.as_object().end()) {
            throw ConfigError("E_CONFIG_PROFILE",
                              "Profile not found: " + *profile,
                              "The configuration file has no 'profiles' section");
        }
        effective = merge_objects(effective, resolve_profile(profiles_it->second, *profile));
    }

    if (auto name = get_string(effective, {"identity", "name"})) {
        if (!CommandExecutor::is_valid_display_name(*name)) {
            throw ConfigError("E_CONFIG_VALUE",
                              "identity.name is not a valid display name",
                              "Names cannot contain spaces, ':' or control characters");
        }
        config.display_name = *name;
    }
    if (auto port = get_int64(effective, {"network", "port"})) {
        config.listen_port = require_port(*port, "network.port");
    }
    if (auto address = get_string(effective, {"network", "address"})) {
        if (!protocol::is_valid_identity_field(*address)) {
            throw ConfigError("E_CONFIG_VALUE", "network.address must be a non-empty IPv4 address or host name");
        }
        config.local_address = *address;
    }
    if (auto port = get_int64(effective, {"network", "default_peer_port"})) {
        config.default_peer_port = require_port(*port, "network.default_peer_port");
    }
    if (auto ttl = get_int64(effective, {"presence", "ttl"})) {
        config.presence_ttl = std::chrono::seconds(require_positive(*ttl, "presence.ttl"));
    }
    if (auto interval = get_int64(effective, {"keepalive", "interval"})) {
        config.keepalive_interval = std::chrono::seconds(require_positive(*interval, "keepalive.interval"));
    }
    if (auto send_ms = get_int64(effective, {"timeouts", "send_ms"})) {
        config.send_timeout = std::chrono::milliseconds(require_positive(*send_ms, "timeouts.send_ms"));
    }
    if (auto probe_ms = get_int64(effective, {"timeouts", "probe_ms"})) {
        config.probe_timeout = std::chrono::milliseconds(require_positive(*probe_ms, "timeouts.probe_ms"));
    }
    if (auto peers_file = get_string(effective, {"storage", "peers_file"})) {
        config.peers_file = *peers_file;
    }
    if (auto history_file = get_string(effective, {"storage", "history_file"})) {
        config.history_file = *history_file;
    }
    if (auto lines = get_int64(effective, {"storage", "history_lines"})) {
        config.history_tail_lines = static_cast<std::size_t>(require_positive(*lines, "storage.history_lines"));
    }
    if (auto enabled = get_bool(effective, {"logging", "enabled"})) {
        config.log_enabled = *enabled;
    }
    if (auto file = get_string(effective, {"logging", "file"})) {
        config.log_file = *file;
    }
    if (auto level = get_string(effective, {"logging", "level"})) {
        if (!log::StructuredLogger::parse_level(*level).has_value()) {
            throw ConfigError("E_CONFIG_VALUE",
                              "logging.level must be one of debug, info, warning, error");
        }
        config.log_level = *level;
    }
}

void load_config_file(const std::filesystem::path& path, const std::optional<std::string>& profile, Config& config) {
    apply_document(load_document(path), profile, config);
}

}  // namespace peerchat::config
