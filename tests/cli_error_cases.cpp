#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <sys/wait.h>

namespace {

struct CommandResult {
    int exit_code;
    std::string output;
};

CommandResult run_cli(const std::string& executable, const std::string& arguments) {
    const std::string command = "\"" + executable + "\" " + arguments + " 2>&1";
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("Failed to open a pipe to the CLI");
    }

    std::string output;
    std::array<char, 256> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe)) {
        output.append(buffer.data());
    }

    const int status = pclose(pipe);
    int exit_code = -1;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    }
    return CommandResult{exit_code, output};
}

bool expect_contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool expect_failure(const std::string& executable,
                    const std::string& arguments,
                    const std::string& needle,
                    const std::string& label) {
    const auto result = run_cli(executable, arguments);
    if (result.exit_code == 1 && expect_contains(result.output, needle)) {
        return true;
    }
    std::cerr << "Failure on " << label << ". exit=" << result.exit_code << "\n" << result.output << std::endl;
    return false;
}

}  // namespace

int main() {
    const char* executable_env = std::getenv("PEERCHAT_CLI_EXECUTABLE");
    if (!executable_env) {
        std::cerr << "PEERCHAT_CLI_EXECUTABLE is not defined" << std::endl;
        return 1;
    }

    const std::string executable = std::filesystem::path(executable_env).string();

    try {
        const auto help = run_cli(executable, "--help");
        if (help.exit_code != 0 || !expect_contains(help.output, "Usage: peerchat")) {
            std::cerr << "Failure on --help. exit=" << help.exit_code << "\n" << help.output << std::endl;
            return 1;
        }

        const auto version = run_cli(executable, "--version");
        if (version.exit_code != 0 || !expect_contains(version.output, "peerchat v")) {
            std::cerr << "Failure on --version. exit=" << version.exit_code << "\n" << version.output << std::endl;
            return 1;
        }

        if (!expect_failure(executable, "--bogus", "Error [E_UNKNOWN_OPTION]: Unknown option: --bogus", "unknown option") ||
            !expect_failure(executable, "--port", "Error [E_MISSING_VALUE]", "--port without value") ||
            !expect_failure(executable, "--port 0", "--port must be a port between 1 and 65535", "--port 0") ||
            !expect_failure(executable, "-p 70000", "Error [E_INVALID_VALUE]", "-p out of range") ||
            !expect_failure(executable, "--name a:b", "Invalid display name", "--name with delimiter") ||
            !expect_failure(executable, "--address 10.0.0.1:9", "Invalid advertised address", "--address with port") ||
            !expect_failure(executable, "--profile lab", "--profile requires --config", "--profile alone") ||
            !expect_failure(executable,
                            "--config /nonexistent/peerchat.yaml",
                            "Error [E_CONFIG_NOT_FOUND]",
                            "missing config file")) {
            return 1;
        }

        const auto temp_dir = std::filesystem::temp_directory_path() / "peerchat_cli_error_cases";
        std::filesystem::remove_all(temp_dir);
        std::filesystem::create_directories(temp_dir);
        const auto config_path = temp_dir / "peerchat.yaml";
        {
            std::ofstream out(config_path);
            out << "network:\n"
                << "  port: 0\n";
        }
        if (!expect_failure(executable,
                            "--config \"" + config_path.string() + "\"",
                            "Error [E_CONFIG_VALUE]: network.port must be between 1 and 65535",
                            "config with port 0")) {
            return 1;
        }
        {
            std::ofstream out(config_path);
            out << "identity:\n"
                << "  name: alice\n"
                << "profiles:\n"
                << "  lab:\n"
                << "    network:\n"
                << "      port: 40123\n";
        }
        if (!expect_failure(executable,
                            "--config \"" + config_path.string() + "\" --profile field",
                            "Error [E_CONFIG_PROFILE]: Profile not found: field",
                            "unknown profile")) {
            return 1;
        }
        std::filesystem::remove_all(temp_dir);
    } catch (const std::exception& ex) {
        std::cerr << "Exception during CLI tests: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
