#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace peerchat {

class Node;

enum class CommandAction {
    None,
    Quit,
    ClearScreen
};

struct CommandResponse {
    bool success{true};
    std::string code{"OK"};
    std::string message;
    std::vector<std::string> lines;
    CommandAction action{CommandAction::None};
};

// Local command surface. Names are accepted with or without a leading '/';
// args is the raw remainder of the command line.
class CommandExecutor {
public:
    explicit CommandExecutor(Node& node);

    CommandResponse execute(std::string_view name, std::string_view args);

    // "/whisper bob hi there" -> {"whisper", "bob hi there"}
    static std::pair<std::string, std::string> split_command_line(std::string_view line);

    static bool is_valid_display_name(std::string_view name) noexcept;

private:
    Node& node_;

    CommandResponse help() const;
    CommandResponse history() const;
    CommandResponse users();
    CommandResponse peers() const;
    CommandResponse whisper(std::string_view args);
    CommandResponse connect(std::string_view args);
    CommandResponse disconnect(std::string_view args);
    CommandResponse rename(std::string_view args);
};

}  // namespace peerchat
