#include "backup_api.hpp"
#include "backup.hpp"
#include <format>

std::expected<void, std::string> BackupAPI::startBackup(const std::string& configFile, const std::string& path, std::optional<bool> verbose) {
    try {
        PathSelector selector = PathSelector::parse(path);
        Configuration config = loadConfiguration(configFile, verbose);
        if (!backup(config, selector)) {
            return std::unexpected(std::format("Back-up of {} failed", config.name));
        }
        return {};
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to start backup: {}", e.what()));
    }
}

std::expected<void, std::string> BackupAPI::startRestore(const std::string& configFile, const std::string& path, std::optional<bool> verbose) {
    try {
        PathSelector selector = PathSelector::parse(path);
        Configuration config = loadConfiguration(configFile, verbose);
        if (!restore(config, selector)) {
            return std::unexpected(std::format("Restore of {} failed", config.name));
        }
        return {};
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to start restore: {}", e.what()));
    }
}
