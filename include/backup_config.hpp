/**
 * @file backup_config.hpp
 * @brief Configuration management for LinkVault.
 *
 * Defines the configuration of one backup job: its source, its candidate targets, its
 * notifiers, the options passed to the transfer tool, and where it logs to.
 *
 * @note Configuration is loaded from a JSON file. Relative local paths are resolved against
 * the directory containing the file.
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include "location.hpp"
#include "notification.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Options passed through to the transfer tool.
 */
struct TransferOptions {
    std::vector<std::string> includes;   ///< rsync --include patterns.
    std::vector<std::string> excludes;   ///< rsync --exclude patterns.
    std::vector<std::string> sshOptions; ///< Extra "-o Key=Value" options for the ssh transport.
};

/**
 * @brief Configuration of a single backup job.
 *
 * Owns the source, target and notifier for the duration of an operation. The notifier is
 * declared first so that it outlives the locations reporting through it.
 */
class Configuration {
public:
    /**
     * @brief Constructs a configuration.
     *
     * @param name Name of the backup job, used in notifications.
     * @param notifier Notifier for the job. A stdio notifier is used if none is given.
     */
    explicit Configuration(std::string name, std::unique_ptr<Notifier> notifier = nullptr);

    Configuration(Configuration&&) = default;
    Configuration& operator=(Configuration&&) = default;

    /**
     * @brief Logs a message to stdout and to the configured log file.
     *
     * @param message Message to log.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs an error to stderr and to the configured log file.
     *
     * @param message Error message to log.
     */
    void logError(const std::string& message) const;

    std::unique_ptr<Notifier> notifier;  ///< Notifier for the job.
    std::string name;                    ///< Name of the backup job.
    bool verbose = false;                ///< Whether the transfer tool reports verbose progress.
    std::unique_ptr<Source> source;      ///< Location backed up from.
    std::unique_ptr<Target> target;      ///< Location backed up to, usually a FirstAvailableTarget.
    TransferOptions transferOptions;     ///< Options passed to the transfer tool.
    std::string logFile;                 ///< Log file; empty to log to the console only.
};

/**
 * @brief Loads a configuration from a JSON file.
 *
 * Source, target and notifier types are looked up in fixed registration tables.
 *
 * @param configFile Path to the JSON configuration file.
 * @param verbose Overrides the file's "verbose" setting when given.
 * @return Configuration The loaded configuration.
 * @throws std::runtime_error If the file is unreadable or invalid.
 */
Configuration loadConfiguration(const std::string& configFile, std::optional<bool> verbose = std::nullopt);

/**
 * @brief Names of the location types a configuration file may use.
 */
std::vector<std::string> locationTypes();

/**
 * @brief Names of the notifier types a configuration file may use.
 */
std::vector<std::string> notifierTypes();

#endif // BACKUP_CONFIG_HPP
