// Shared helpers for the LinkVault test executables

#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include "location.hpp"
#include "notification.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// Test helper macros
#define ASSERT_EQ(a, b) do { \
    if ((a) != (b)) { \
        std::cerr << "  FAILED: " << #a << " != " << #b << std::endl; \
        std::cerr << "    Got: '" << (a) << "' vs '" << (b) << "'" << std::endl; \
        std::exit(1); \
    } \
} while(0)

#define ASSERT_TRUE(cond) do { \
    if (!(cond)) { \
        std::cerr << "  FAILED: " << #cond << " is false" << std::endl; \
        std::exit(1); \
    } \
} while(0)

#define ASSERT_FALSE(cond) do { \
    if (cond) { \
        std::cerr << "  FAILED: " << #cond << " is true" << std::endl; \
        std::exit(1); \
    } \
} while(0)

#define ASSERT_THROWS(expr, exception_type) do { \
    bool caught = false; \
    try { expr; } catch (const exception_type&) { caught = true; } \
    if (!caught) { \
        std::cerr << "  FAILED: " << #expr << " did not throw " << #exception_type << std::endl; \
        std::exit(1); \
    } \
} while(0)

// Temporary directory removed on destruction
class TempDir {
public:
    TempDir() {
        std::string pattern = (fs::temp_directory_path() / "linkvault-test-XXXXXX").string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) {
            std::cerr << "  FAILED: cannot create temporary directory" << std::endl;
            std::exit(1);
        }
        path_ = buf.data();
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

inline void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline size_t countEntries(const fs::path& dir) {
    size_t count = 0;
    for (auto it = fs::directory_iterator(dir); it != fs::directory_iterator(); ++it) {
        ++count;
    }
    return count;
}

// Records every notification as "channel: message"
class RecordingNotifier : public Notifier {
public:
    void state(const std::string& message) override { messages.push_back("state: " + message); }
    void inform(const std::string& message) override { messages.push_back("inform: " + message); }
    void confirm(const std::string& message) override { messages.push_back("confirm: " + message); }
    void alert(const std::string& message) override { messages.push_back("alert: " + message); }

    std::vector<std::string> channels() const {
        std::vector<std::string> result;
        for (const auto& message : messages) {
            result.push_back(message.substr(0, message.find(':')));
        }
        return result;
    }

    std::vector<std::string> messages;
};

// Target with a fixed availability that counts how often it was probed and records what it was asked to do
class FakeTarget : public Target {
public:
    FakeTarget(bool available, std::string address) : available(available), address(std::move(address)) {}

    bool isAvailable() override {
        ++probes;
        return available;
    }

    std::string toTransferAddress(const PathSelector& selector) const override {
        return selector.appendTo(address);
    }

    std::expected<void, std::string> prepareDirectory(const PathSelector& directory) override {
        prepared.push_back(directory.path());
        return {};
    }

    std::expected<void, std::string> snapshot(const std::string& name) override {
        if (failingSnapshot) {
            return std::unexpected("No space left on device");
        }
        snapshots.push_back(name);
        return {};
    }

    bool available;
    std::string address;
    bool failingSnapshot = false;
    int probes = 0;
    std::vector<std::string> prepared;
    std::vector<std::string> snapshots;
};

inline std::string joined(const std::vector<std::string>& values) {
    std::string result;
    for (const auto& value : values) {
        if (!result.empty()) {
            result += ' ';
        }
        result += value;
    }
    return result;
}

#endif // TEST_SUPPORT_HPP
