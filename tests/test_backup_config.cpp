// Configuration Test Suite
// Tests loading backup configurations from JSON and configuration logging

#include "backup_config.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <stdexcept>

namespace {

fs::path writeConfig(const TempDir& dir, const std::string& json) {
    fs::path file = dir.path() / "linkvault.json";
    writeFile(file, json);
    return file;
}

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

}

void test_load_full_configuration() {
    std::cout << "  test_load_full_configuration..." << std::endl;

    TempDir dir;
    fs::path file = writeConfig(dir, R"({
        "name": "documents",
        "verbose": true,
        "source": {"type": "path", "path": "data"},
        "targets": [
            {"type": "path", "path": "../backups/documents"},
            {"type": "ssh", "user": "bart", "host": "backup.example.com", "port": 2222,
             "path": "/var/backups/me", "identity": "keys/backup_ed25519"}
        ],
        "includes": ["*.txt"],
        "excludes": [".cache/", "*.tmp"],
        "ssh_options": ["Compression=yes"],
        "notifications": [{"type": "stdio"}]
    })");

    Configuration config = loadConfiguration(file.string());

    ASSERT_EQ(config.name, "documents");
    ASSERT_TRUE(config.verbose);

    auto* source = dynamic_cast<PathSource*>(config.source.get());
    ASSERT_TRUE(source != nullptr);
    ASSERT_EQ(source->path(), (dir.path() / "data").lexically_normal());

    auto* target = dynamic_cast<FirstAvailableTarget*>(config.target.get());
    ASSERT_TRUE(target != nullptr);
    ASSERT_EQ(target->targets().size(), 2u);

    auto* local = dynamic_cast<PathTarget*>(target->targets()[0].get());
    ASSERT_TRUE(local != nullptr);
    ASSERT_EQ(local->path(), (dir.path().parent_path() / "backups" / "documents").lexically_normal());

    auto* remote = dynamic_cast<SshTarget*>(target->targets()[1].get());
    ASSERT_TRUE(remote != nullptr);
    ASSERT_EQ(remote->endpoint().user, "bart");
    ASSERT_EQ(remote->endpoint().host, "backup.example.com");
    ASSERT_EQ(remote->endpoint().port, 2222);
    ASSERT_EQ(remote->endpoint().path, "/var/backups/me");
    ASSERT_TRUE(remote->endpoint().identity.has_value());
    ASSERT_EQ(*remote->endpoint().identity, (dir.path() / "keys" / "backup_ed25519").string());

    ASSERT_EQ(joined(config.transferOptions.includes), "*.txt");
    ASSERT_EQ(joined(config.transferOptions.excludes), ".cache/ *.tmp");
    ASSERT_EQ(joined(config.transferOptions.sshOptions), "Compression=yes");
    ASSERT_TRUE(dynamic_cast<StdioNotifier*>(config.notifier.get()) != nullptr);
}

void test_load_minimal_configuration_defaults() {
    std::cout << "  test_load_minimal_configuration_defaults..." << std::endl;

    TempDir dir;
    fs::path file = writeConfig(dir, R"({
        "source": {"type": "path", "path": "/home/me/documents"},
        "targets": [{"type": "ssh", "user": "bart", "host": "backup.example.com", "path": "/var/backups/me"}]
    })");

    Configuration config = loadConfiguration(file.string());

    ASSERT_EQ(config.name, dir.path().string());
    ASSERT_FALSE(config.verbose);
    ASSERT_TRUE(config.logFile.empty());
    ASSERT_TRUE(config.transferOptions.includes.empty());
    ASSERT_TRUE(dynamic_cast<StdioNotifier*>(config.notifier.get()) != nullptr);

    auto* target = dynamic_cast<FirstAvailableTarget*>(config.target.get());
    auto* remote = dynamic_cast<SshTarget*>(target->targets()[0].get());
    ASSERT_EQ(remote->endpoint().port, 22);
    ASSERT_FALSE(remote->endpoint().identity.has_value());
}

void test_verbose_override() {
    std::cout << "  test_verbose_override..." << std::endl;

    TempDir dir;
    fs::path file = writeConfig(dir, R"({
        "verbose": true,
        "source": {"type": "path", "path": "data"},
        "targets": [{"type": "path", "path": "backups"}]
    })");

    ASSERT_TRUE(loadConfiguration(file.string()).verbose);
    ASSERT_FALSE(loadConfiguration(file.string(), false).verbose);
    ASSERT_TRUE(loadConfiguration(file.string(), true).verbose);
}

void test_multiple_notifiers_are_grouped() {
    std::cout << "  test_multiple_notifiers_are_grouped..." << std::endl;

    TempDir dir;
    fs::path file = writeConfig(dir, R"({
        "source": {"type": "path", "path": "data"},
        "targets": [{"type": "path", "path": "backups"}],
        "notifications": [
            {"type": "stdio"},
            {"type": "command", "fallback": ["true"], "alert": ["logger", "{message}"]},
            {"type": "file", "state": "log/state", "inform": "log/inform", "confirm": "log/confirm", "alert": "log/alert"}
        ]
    })");

    Configuration config = loadConfiguration(file.string());
    auto* grouped = dynamic_cast<GroupedNotifier*>(config.notifier.get());
    ASSERT_TRUE(grouped != nullptr);
    ASSERT_EQ(grouped->notifiers().size(), 3u);
    ASSERT_TRUE(dynamic_cast<CommandNotifier*>(grouped->notifiers()[1].get()) != nullptr);
    ASSERT_TRUE(dynamic_cast<FileNotifier*>(grouped->notifiers()[2].get()) != nullptr);
}

void test_invalid_configurations_are_rejected() {
    std::cout << "  test_invalid_configurations_are_rejected..." << std::endl;

    TempDir dir;
    const std::vector<std::string> invalid = {
        // Not JSON
        "{",
        // Not an object
        "[]",
        // Missing source
        R"({"targets": [{"type": "path", "path": "backups"}]})",
        // Missing targets
        R"({"source": {"type": "path", "path": "data"}})",
        // Empty targets
        R"({"source": {"type": "path", "path": "data"}, "targets": []})",
        // Unknown type
        R"({"source": {"type": "ftp", "path": "data"}, "targets": [{"type": "path", "path": "backups"}]})",
        // Missing path
        R"({"source": {"type": "path"}, "targets": [{"type": "path", "path": "backups"}]})",
        // Port out of range
        R"({"source": {"type": "path", "path": "data"},
            "targets": [{"type": "ssh", "user": "bart", "host": "h", "path": "/p", "port": 70000}]})",
        // Command notifier without a fallback
        R"({"source": {"type": "path", "path": "data"}, "targets": [{"type": "path", "path": "backups"}],
            "notifications": [{"type": "command", "alert": ["logger", "{message}"]}]})",
        // Non-string pattern
        R"({"source": {"type": "path", "path": "data"}, "targets": [{"type": "path", "path": "backups"}],
            "excludes": [1]})",
    };

    for (const auto& json : invalid) {
        fs::path file = writeConfig(dir, json);
        ASSERT_THROWS(loadConfiguration(file.string()), std::runtime_error);
    }

    ASSERT_THROWS(loadConfiguration((dir.path() / "missing.json").string()), std::runtime_error);
}

void test_unknown_type_names_alternatives() {
    std::cout << "  test_unknown_type_names_alternatives..." << std::endl;

    TempDir dir;
    fs::path file = writeConfig(dir, R"({
        "source": {"type": "path", "path": "data"},
        "targets": [{"type": "ftp", "path": "backups"}]
    })");

    std::string message;
    try {
        loadConfiguration(file.string());
    } catch (const std::runtime_error& e) {
        message = e.what();
    }
    ASSERT_EQ(message, "`targets[][type]` must be one of the following: path, ssh, but `ftp` was given.");
}

void test_registered_types() {
    std::cout << "  test_registered_types..." << std::endl;

    ASSERT_TRUE(contains(locationTypes(), "path"));
    ASSERT_TRUE(contains(locationTypes(), "ssh"));
    for (const std::string type : {"stdio", "notify-send", "command", "file", "telegram"}) {
        ASSERT_TRUE(contains(notifierTypes(), type));
    }
}

void test_logging_writes_to_log_file() {
    std::cout << "  test_logging_writes_to_log_file..." << std::endl;

    TempDir dir;
    fs::path file = writeConfig(dir, R"({
        "source": {"type": "path", "path": "data"},
        "targets": [{"type": "path", "path": "backups"}],
        "logging": {"file": "linkvault.log"}
    })");

    Configuration config = loadConfiguration(file.string());
    ASSERT_EQ(config.logFile, (dir.path() / "linkvault.log").string());

    config.logMessage("Backing up documents");
    config.logError("rsync exited with status 23");

    std::string log = readFile(dir.path() / "linkvault.log");
    ASSERT_TRUE(log.find("] Backing up documents\n") != std::string::npos);
    ASSERT_TRUE(log.find("] ERROR: rsync exited with status 23\n") != std::string::npos);
}

int main() {
    std::cout << "Configuration tests" << std::endl;

    test_load_full_configuration();
    test_load_minimal_configuration_defaults();
    test_verbose_override();
    test_multiple_notifiers_are_grouped();
    test_invalid_configurations_are_rejected();
    test_unknown_type_names_alternatives();
    test_registered_types();
    test_logging_writes_to_log_file();

    std::cout << "All Configuration tests passed" << std::endl;
    return 0;
}
