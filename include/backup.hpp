/**
 * @file backup.hpp
 * @brief Backup and restore orchestration for LinkVault.
 *
 * A backup checks that the source and a target are available, creates a new snapshot on the
 * target, and runs rsync from the source into the target's "latest" snapshot. A restore runs
 * the same checks and then rsync in the opposite direction, without creating a snapshot.
 * The receiving directory of a scoped transfer is created, with its parents, beforehand.
 *
 * Every step blocks until it is done. Interrupting a transfer leaves the snapshot it was
 * filling as it is.
 *
 * @note Requires rsync in the system PATH, and ssh for remote locations.
 */

#ifndef BACKUP_HPP
#define BACKUP_HPP

#include "backup_config.hpp"
#include "path_selector.hpp"
#include "process.hpp"
#include <string>
#include <vector>

/**
 * @brief Builds the rsync command line for one transfer.
 *
 * @param origin Address to copy from.
 * @param destination Address to copy to.
 * @param sshTransport ssh command for a remote side, or empty if both sides are local.
 * @param options Include/exclude patterns and extra ssh options.
 * @param verbose If true, rsync reports verbose progress.
 * @return std::vector<std::string> The argument vector, starting with "rsync".
 */
std::vector<std::string> buildRsyncCommand(const std::string& origin,
                                           const std::string& destination,
                                           const std::vector<std::string>& sshTransport,
                                           const TransferOptions& options,
                                           bool verbose);

/**
 * @brief Drives backups and restores of one configuration.
 */
class TransferOrchestrator {
public:
    /**
     * @brief Progress of the current or last operation.
     */
    enum class State {
        Initializing,
        CheckingAvailability,
        Snapshotting,
        Transferring,
        Completed,
        Failed
    };

    /**
     * @brief Constructs an orchestrator.
     *
     * @param config Configuration to operate on. Must outlive the orchestrator.
     * @param runner Runs the transfer tool.
     */
    explicit TransferOrchestrator(Configuration& config, CommandRunner runner = runCommand);

    /**
     * @brief Backs up the source to a new snapshot on the target.
     *
     * Notifications, in order: state (start), then either alert (source or target
     * unavailable) or inform (started) followed by confirm (success) or alert (failure).
     *
     * @param selector Scope of the backup, relative to the source root.
     * @return bool True if the backup completed.
     */
    bool backup(const PathSelector& selector = PathSelector());

    /**
     * @brief Restores the target's latest snapshot to the source.
     *
     * Notifications follow the same order as backup(). No snapshot is created.
     *
     * @param selector Scope of the restore, relative to the snapshot root.
     * @return bool True if the restore completed.
     */
    bool restore(const PathSelector& selector = PathSelector());

    State state() const { return state_; }

private:
    bool checkAvailability();
    bool transfer(const std::string& origin, const std::string& destination);
    bool fail(const std::string& detail, const std::string& message);

    Configuration& config;
    CommandRunner runner;
    State state_ = State::Initializing;
};

/**
 * @brief Returns a human-readable name for an orchestrator state.
 */
const char* stateLabel(TransferOrchestrator::State state);

/**
 * @brief Backs up a configuration.
 *
 * @see TransferOrchestrator::backup()
 */
bool backup(Configuration& config, const PathSelector& selector = PathSelector());

/**
 * @brief Restores a configuration.
 *
 * @see TransferOrchestrator::restore()
 */
bool restore(Configuration& config, const PathSelector& selector = PathSelector());

#endif // BACKUP_HPP
