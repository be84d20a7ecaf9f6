#include "peerchat/directory/PeerDirectory.hpp"
#include "peerchat/log/StructuredLogger.hpp"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace peerchat;

namespace {

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream input(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(input, line)) {
        lines.push_back(line);
    }
    return lines;
}

bool contains(const std::vector<PeerRecord>& records, const PeerRecord& record) {
    return std::find(records.begin(), records.end(), record) != records.end();
}

}  // namespace

int main() {
    log::StructuredLogger::instance().set_enabled(false);

    const auto temp_dir = std::filesystem::temp_directory_path() / "peerchat_peer_directory_test";
    std::filesystem::remove_all(temp_dir);

    // In-memory directory: idempotent upsert, overwrite, remove.
    {
        PeerDirectory directory;
        assert(!directory.persistent());

        const auto first = directory.upsert("10.0.0.1", 9000);
        assert(first.changed);
        assert(!first.found);
        const auto second = directory.upsert("10.0.0.1", 9000);
        assert(!second.changed);
        assert(second.found);
        assert(directory.size() == 1);
        assert(directory.port_of("10.0.0.1") == 9000);

        const auto overwrite = directory.upsert("10.0.0.1", 9001);
        assert(overwrite.changed);
        assert(overwrite.found);
        assert(directory.size() == 1);
        assert(directory.port_of("10.0.0.1") == 9001);

        const auto kept = directory.insert_if_absent("10.0.0.1", 12345);
        assert(!kept.changed);
        assert(directory.port_of("10.0.0.1") == 9001);
        assert(directory.insert_if_absent("10.0.0.2", 12345).changed);
        assert(directory.port_of("10.0.0.2") == 12345);

        const auto removed = directory.remove("10.0.0.2");
        assert(removed.found);
        assert(removed.changed);
        assert(!directory.port_of("10.0.0.2").has_value());

        const auto missing = directory.remove("10.0.0.99");
        assert(!missing.found);
        assert(!missing.changed);
        assert(missing.persisted());
    }

    // Persistence: load creates the file, additions append, changes rewrite.
    const auto peers_file = temp_dir / "nested" / "peers";
    {
        PeerDirectory directory(peers_file);
        const auto report = directory.load();
        assert(!report.error.has_value());
        assert(report.loaded == 0);
        assert(std::filesystem::exists(peers_file));

        assert(directory.upsert("10.0.0.1", 9000).persisted());
        assert(directory.upsert("10.0.0.2", 9100).persisted());
        auto lines = read_lines(peers_file);
        assert(lines.size() == 2);
        assert(lines[0] == "10.0.0.1 9000");
        assert(lines[1] == "10.0.0.2 9100");

        assert(directory.upsert("10.0.0.1", 9001).persisted());
        lines = read_lines(peers_file);
        assert(lines.size() == 2);
        assert(std::count(lines.begin(), lines.end(), std::string("10.0.0.1 9001")) == 1);

        assert(directory.remove("10.0.0.2").persisted());
        lines = read_lines(peers_file);
        assert(lines.size() == 1);
        assert(lines[0] == "10.0.0.1 9001");
        assert(!std::filesystem::exists(peers_file.string() + ".tmp"));
    }

    // Reload merges persisted entries and skips lines that do not parse.
    {
        {
            std::ofstream out(peers_file, std::ios::app);
            out << "garbage-line\n";
            out << "10.0.0.3 notaport\n";
            out << "\n";
            out << "10.0.0.4 7000\n";
        }
        PeerDirectory reloaded(peers_file);
        const auto report = reloaded.load();
        assert(!report.error.has_value());
        assert(report.loaded == 2);
        assert(report.skipped == 2);
        const auto records = reloaded.list();
        assert(records.size() == 2);
        assert(contains(records, PeerRecord{"10.0.0.1", 9001}));
        assert(contains(records, PeerRecord{"10.0.0.4", 7000}));
    }

    // Storage failures are reported while the in-memory change still applies.
    {
        const auto blocker = temp_dir / "blocker";
        {
            std::ofstream out(blocker);
            out << "not a directory\n";
        }
        PeerDirectory directory(blocker / "peers");
        const auto report = directory.load();
        assert(report.error.has_value());

        const auto update = directory.upsert("10.0.0.5", 5000);
        assert(update.changed);
        assert(!update.persisted());
        assert(directory.port_of("10.0.0.5") == 5000);

        const auto removal = directory.remove("10.0.0.5");
        assert(removal.found);
        assert(!removal.persisted());
        assert(directory.size() == 0);
    }

    std::filesystem::remove_all(temp_dir);

    // Address and endpoint helpers shared with the dispatcher and the CLI.
    {
        assert(is_numeric_ipv4("10.0.0.1"));
        assert(is_numeric_ipv4("255.255.255.255"));
        assert(!is_numeric_ipv4(""));
        assert(!is_numeric_ipv4("chat.example.com"));
        assert(!is_numeric_ipv4("10.0.0"));
        assert(!is_numeric_ipv4("10.0.0.256"));
        assert(!is_numeric_ipv4("10.0.0.1 "));

        assert(parse_endpoint("10.0.0.1:9000") == (Endpoint{"10.0.0.1", 9000}));
        assert(!parse_endpoint("10.0.0.1:0").has_value());
        assert(!parse_endpoint(":9000").has_value());
        assert(endpoint_to_string(Endpoint{"10.0.0.1", 9000}) == "10.0.0.1:9000");
    }

    return 0;
}
