/**
 * @file backup_api.hpp
 * @brief High-level API for running LinkVault jobs.
 *
 * Loads a configuration file and runs a single backup or restore with it. This is the
 * entry point used by the command-line tool.
 */

#ifndef BACKUP_API_HPP
#define BACKUP_API_HPP

#include <expected>
#include <optional>
#include <string>

/**
 * @brief API for running backups and restores in LinkVault.
 */
class BackupAPI {
public:
    /**
     * @brief Runs a backup.
     *
     * @param configFile Path to the JSON configuration file.
     * @param path Optional scope: a file, or a directory ending with a separator.
     * @param verbose Overrides the configured verbosity when given.
     * @return std::expected<void, std::string> Success or an error message.
     */
    static std::expected<void, std::string> startBackup(const std::string& configFile,
                                                        const std::string& path = "",
                                                        std::optional<bool> verbose = std::nullopt);

    /**
     * @brief Runs a restore.
     *
     * @param configFile Path to the JSON configuration file.
     * @param path Optional scope: a file, or a directory ending with a separator.
     * @param verbose Overrides the configured verbosity when given.
     * @return std::expected<void, std::string> Success or an error message.
     */
    static std::expected<void, std::string> startRestore(const std::string& configFile,
                                                         const std::string& path = "",
                                                         std::optional<bool> verbose = std::nullopt);
};

#endif // BACKUP_API_HPP
