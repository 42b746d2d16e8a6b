#include "location.hpp"
#include "process.hpp"
#include "snapshot.hpp"
#include <format>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

std::string remoteAddress(const SshEndpoint& endpoint, const std::string& path) {
    return std::format("{}@{}:{}", endpoint.user, endpoint.host, path);
}

std::string latestPath(const std::string& root) {
    return PathSelector::directory(std::string(kLatestSnapshotLink) + "/").appendTo(root);
}

void requireDirectorySelector(const PathSelector& directory) {
    if (directory.isFile()) {
        throw std::logic_error("Only directories can be prepared for a transfer");
    }
}

// Addresses of directory selectors end with a separator; parent_path() drops it.
std::expected<void, std::string> createLocalDirectory(const std::string& address) {
    fs::path directory = fs::path(address).parent_path();
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to create directory {}: {}", directory.string(), ec.message()));
    }
    return {};
}

std::expected<void, std::string> createRemoteDirectory(const SshEndpoint& endpoint, const std::string& path) {
    auto result = runRemoteCommand(endpoint, "mkdir -p " + shellQuote(path));
    if (!result) {
        return std::unexpected(result.error());
    }
    if (*result != 0) {
        return std::unexpected(std::format("Creating directory {} on {} failed with exit code {}", path, endpoint.host, *result));
    }
    return {};
}

bool checkSshEndpoint(Notifier& notifier, const SshEndpoint& endpoint) {
    auto result = probeSshEndpoint(endpoint);
    if (!result) {
        notifier.alert(result.error());
        return false;
    }
    return true;
}

}

PathSource::PathSource(Notifier& notifier, fs::path path) : notifier_(notifier), path_(std::move(path)) {}

bool PathSource::isAvailable() {
    std::error_code ec;
    if (fs::exists(path_, ec)) {
        return true;
    }
    notifier_.alert(std::format("Path {} does not exist.", path_.string()));
    return false;
}

std::string PathSource::toTransferAddress(const PathSelector& selector) const {
    return selector.appendTo(path_.string());
}

std::expected<void, std::string> PathSource::prepareDirectory(const PathSelector& directory) {
    requireDirectorySelector(directory);
    return createLocalDirectory(toTransferAddress(directory));
}

PathTarget::PathTarget(Notifier& notifier, fs::path path) : notifier_(notifier), path_(std::move(path)) {}

bool PathTarget::isAvailable() {
    std::error_code ec;
    if (fs::exists(path_, ec)) {
        return true;
    }
    notifier_.alert(std::format("Path {} does not exist.", path_.string()));
    return false;
}

std::string PathTarget::toTransferAddress(const PathSelector& selector) const {
    return selector.appendTo(latestPath(path_.string()));
}

std::expected<void, std::string> PathTarget::prepareDirectory(const PathSelector& directory) {
    requireDirectorySelector(directory);
    return createLocalDirectory(toTransferAddress(directory));
}

std::expected<void, std::string> PathTarget::snapshot(const std::string& name) {
    return createLocalSnapshot(path_, name);
}

SshSource::SshSource(Notifier& notifier, SshEndpoint endpoint) : notifier_(notifier), endpoint_(std::move(endpoint)) {}

bool SshSource::isAvailable() {
    return checkSshEndpoint(notifier_, endpoint_);
}

std::string SshSource::toTransferAddress(const PathSelector& selector) const {
    return remoteAddress(endpoint_, selector.appendTo(endpoint_.path));
}

std::vector<std::string> SshSource::sshTransport() const {
    return sshTransportArgs(endpoint_);
}

std::expected<void, std::string> SshSource::prepareDirectory(const PathSelector& directory) {
    requireDirectorySelector(directory);
    if (directory.isNone()) {
        return {};
    }
    return createRemoteDirectory(endpoint_, directory.appendTo(endpoint_.path));
}

SshTarget::SshTarget(Notifier& notifier, SshEndpoint endpoint) : notifier_(notifier), endpoint_(std::move(endpoint)) {}

bool SshTarget::isAvailable() {
    return checkSshEndpoint(notifier_, endpoint_);
}

std::string SshTarget::toTransferAddress(const PathSelector& selector) const {
    return remoteAddress(endpoint_, selector.appendTo(latestPath(endpoint_.path)));
}

std::vector<std::string> SshTarget::sshTransport() const {
    return sshTransportArgs(endpoint_);
}

std::expected<void, std::string> SshTarget::prepareDirectory(const PathSelector& directory) {
    requireDirectorySelector(directory);
    if (directory.isNone()) {
        return {};
    }
    return createRemoteDirectory(endpoint_, directory.appendTo(latestPath(endpoint_.path)));
}

std::expected<void, std::string> SshTarget::snapshot(const std::string& name) {
    auto result = runRemoteCommand(endpoint_, remoteSnapshotCommand(endpoint_.path, name));
    if (!result) {
        return std::unexpected(result.error());
    }
    if (*result != 0) {
        return std::unexpected(std::format("Creating snapshot {} on {} failed with exit code {}", name, endpoint_.host, *result));
    }
    return {};
}

FirstAvailableTarget::FirstAvailableTarget(std::vector<std::unique_ptr<Target>> targets) : targets_(std::move(targets)) {
    if (targets_.empty()) {
        throw std::invalid_argument("At least one target is required");
    }
}

bool FirstAvailableTarget::isAvailable() {
    if (resolved_) {
        return true;
    }
    for (auto& target : targets_) {
        if (target->isAvailable()) {
            resolved_ = target.get();
            return true;
        }
    }
    return false;
}

Target& FirstAvailableTarget::resolvedTarget() const {
    if (!resolved_) {
        throw std::logic_error("No target has been resolved. Call isAvailable() first.");
    }
    return *resolved_;
}

std::string FirstAvailableTarget::toTransferAddress(const PathSelector& selector) const {
    return resolvedTarget().toTransferAddress(selector);
}

std::vector<std::string> FirstAvailableTarget::sshTransport() const {
    return resolvedTarget().sshTransport();
}

std::expected<void, std::string> FirstAvailableTarget::prepareDirectory(const PathSelector& directory) {
    return resolvedTarget().prepareDirectory(directory);
}

std::expected<void, std::string> FirstAvailableTarget::snapshot(const std::string& name) {
    return resolvedTarget().snapshot(name);
}
