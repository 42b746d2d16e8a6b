#include "backup.hpp"
#include "snapshot.hpp"
#include <format>
#include <utility>

std::vector<std::string> buildRsyncCommand(const std::string& origin,
                                           const std::string& destination,
                                           const std::vector<std::string>& sshTransport,
                                           const TransferOptions& options,
                                           bool verbose) {
    std::vector<std::string> argv = {"rsync", "-ar", "--numeric-ids"};
    if (verbose) {
        argv.push_back("--verbose");
        argv.push_back("--progress");
    }
    for (const auto& pattern : options.includes) {
        argv.push_back("--include=" + pattern);
    }
    for (const auto& pattern : options.excludes) {
        argv.push_back("--exclude=" + pattern);
    }
    if (!sshTransport.empty()) {
        std::vector<std::string> ssh = sshTransport;
        for (const auto& option : options.sshOptions) {
            ssh.push_back("-o");
            ssh.push_back(option);
        }
        argv.push_back("-e");
        argv.push_back(formatCommand(ssh));
    }
    argv.push_back(origin);
    argv.push_back(destination);
    return argv;
}

const char* stateLabel(TransferOrchestrator::State state) {
    switch (state) {
        case TransferOrchestrator::State::Initializing:
            return "initializing";
        case TransferOrchestrator::State::CheckingAvailability:
            return "checking availability";
        case TransferOrchestrator::State::Snapshotting:
            return "snapshotting";
        case TransferOrchestrator::State::Transferring:
            return "transferring";
        case TransferOrchestrator::State::Completed:
            return "completed";
        case TransferOrchestrator::State::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

TransferOrchestrator::TransferOrchestrator(Configuration& config, CommandRunner runner)
    : config(config), runner(std::move(runner)) {}

bool TransferOrchestrator::checkAvailability() {
    state_ = State::CheckingAvailability;

    if (!config.source->isAvailable()) {
        config.logError("No back-up source available");
        config.notifier->alert("No back-up source available.");
        state_ = State::Failed;
        return false;
    }

    if (!config.target->isAvailable()) {
        config.logError("No back-up target available");
        config.notifier->alert("No back-up target available.");
        state_ = State::Failed;
        return false;
    }

    return true;
}

bool TransferOrchestrator::fail(const std::string& detail, const std::string& message) {
    config.logError(detail);
    config.notifier->alert(message);
    state_ = State::Failed;
    return false;
}

bool TransferOrchestrator::transfer(const std::string& origin, const std::string& destination) {
    state_ = State::Transferring;

    // Only one side is remote at a time; take the transport from whichever side has one.
    std::vector<std::string> sshTransport = config.source->sshTransport();
    if (sshTransport.empty()) {
        sshTransport = config.target->sshTransport();
    }

    auto argv = buildRsyncCommand(origin, destination, sshTransport, config.transferOptions, config.verbose);
    if (config.verbose) {
        config.logMessage(std::format("Running: {}", formatCommand(argv)));
    }

    auto result = runner(argv);
    if (!result) {
        config.logError(std::format("Failed to run rsync: {}", result.error()));
        return false;
    }
    if (*result != 0) {
        config.logError(std::format("rsync from {} to {} exited with status {}", origin, destination, *result));
        return false;
    }
    return true;
}

bool TransferOrchestrator::backup(const PathSelector& selector) {
    state_ = State::Initializing;
    config.notifier->state(std::format("Initializing back-up {}", config.name));

    if (!checkAvailability()) {
        return false;
    }

    config.notifier->inform(std::format("Backing up {}...", config.name));
    config.logMessage(std::format("Backing up {}", config.name));

    state_ = State::Snapshotting;
    std::string name = snapshotName();
    auto snapshot = config.target->snapshot(name);
    if (!snapshot) {
        return fail(std::format("Failed to create snapshot {}: {}", name, snapshot.error()), "Back-up failed.");
    }
    config.logMessage(std::format("Created snapshot {}", name));

    PathSelector receiving = selector.isFile() ? selector.parentDirectory() : selector;
    auto prepared = config.target->prepareDirectory(receiving);
    if (!prepared) {
        return fail(std::format("Failed to prepare snapshot {}: {}", name, prepared.error()), "Back-up failed.");
    }

    std::string origin = config.source->toTransferAddress(selector);
    std::string destination = config.target->toTransferAddress(receiving);
    if (!transfer(origin, destination)) {
        return fail(std::format("Back-up of {} to snapshot {} failed", config.name, name), "Back-up failed.");
    }

    state_ = State::Completed;
    config.logMessage(std::format("Back-up of {} to snapshot {} complete", config.name, name));
    config.notifier->confirm("Back-up complete.");
    return true;
}

bool TransferOrchestrator::restore(const PathSelector& selector) {
    state_ = State::Initializing;
    config.notifier->state(std::format("Initializing restore {}", config.name));

    if (!checkAvailability()) {
        return false;
    }

    config.notifier->inform(std::format("Restoring {}...", config.name));
    config.logMessage(std::format("Restoring {}", config.name));

    PathSelector receiving = selector.isFile() ? selector.parentDirectory() : selector;
    auto prepared = config.source->prepareDirectory(receiving);
    if (!prepared) {
        return fail(std::format("Failed to prepare restore of {}: {}", config.name, prepared.error()), "Restore failed.");
    }

    std::string origin = config.target->toTransferAddress(selector);
    std::string destination = config.source->toTransferAddress(receiving);
    if (!transfer(origin, destination)) {
        return fail(std::format("Restore of {} failed", config.name), "Restore failed.");
    }

    state_ = State::Completed;
    config.logMessage(std::format("Restore of {} complete", config.name));
    config.notifier->confirm("Restore complete.");
    return true;
}

bool backup(Configuration& config, const PathSelector& selector) {
    return TransferOrchestrator(config).backup(selector);
}

bool restore(Configuration& config, const PathSelector& selector) {
    return TransferOrchestrator(config).restore(selector);
}
