#include "snapshot.hpp"
#include "process.hpp"
#include <ctime>
#include <format>
#include <system_error>

namespace fs = std::filesystem;

std::string snapshotName(std::chrono::system_clock::time_point time) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&timeT, &utc);
    char nameBuf[32];
    std::strftime(nameBuf, sizeof(nameBuf), "%Y-%m-%d_%H-%M-%S_UTC", &utc);
    return nameBuf;
}

std::expected<void, std::string> createLocalSnapshot(const fs::path& root, const std::string& name) {
    fs::path snapshot = root / name;
    fs::path latest = root / kLatestSnapshotLink;
    std::error_code ec;

    bool snapshotExists = fs::exists(fs::symlink_status(snapshot, ec));
    if (!snapshotExists && fs::is_directory(latest, ec)) {
        fs::path previous = fs::canonical(latest, ec);
        if (ec) {
            return std::unexpected(std::format("Failed to resolve {}: {}", latest.string(), ec.message()));
        }
        auto result = runCommand({"cp", "-al", previous.string(), snapshot.string()});
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result != 0) {
            return std::unexpected(std::format("Hardlinking {} to {} failed with exit code {}", previous.string(), snapshot.string(), *result));
        }
    } else {
        fs::create_directories(snapshot, ec);
        if (ec) {
            return std::unexpected(std::format("Failed to create snapshot directory {}: {}", snapshot.string(), ec.message()));
        }
    }

    // "latest" is replaced by renaming a staged link over it and never goes missing.
    fs::path staging = root / (std::string(kLatestSnapshotLink) + ".new");
    fs::remove(staging, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to remove {}: {}", staging.string(), ec.message()));
    }
    fs::create_directory_symlink(name, staging, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to link {} to {}: {}", staging.string(), name, ec.message()));
    }
    fs::rename(staging, latest, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to replace {}: {}", latest.string(), ec.message()));
    }
    return {};
}

std::string remoteSnapshotCommand(const std::string& root, const std::string& name) {
    std::string snapshot = shellQuote(name);
    std::string latest = kLatestSnapshotLink;
    return std::format(
        "cd {0} && if [ ! -e {1} ] && [ -d {2} ]; then cp -al \"$(readlink -f {2})\" {1}; else mkdir -p {1}; fi"
        " && ln -sfn {1} {2}.new && mv -Tf {2}.new {2}",
        shellQuote(root), snapshot, latest);
}
