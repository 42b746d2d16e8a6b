/**
 * @file location.hpp
 * @brief Backup endpoints for LinkVault.
 *
 * A Location is anything a transfer can read from or write to. Sources are only read during
 * backups. Targets additionally hold snapshots. Each capability is a separate interface, and
 * each concrete location implements exactly one of them.
 */

#ifndef LOCATION_HPP
#define LOCATION_HPP

#include "notification.hpp"
#include "path_selector.hpp"
#include "remote_shell.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Capabilities shared by sources and targets.
 */
class Location {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~Location() = default;

    /**
     * @brief Checks whether the location can be used right now.
     *
     * Expected failures (missing path, unreachable host, timeout, rejected credentials) return
     * false and may be reported through the location's notifier.
     *
     * @return bool True if the location is available.
     */
    virtual bool isAvailable() = 0;

    /**
     * @brief Renders the address the transfer tool uses for a selector on this location.
     *
     * @param selector Scope of the transfer.
     * @return std::string Local path or remote address.
     */
    virtual std::string toTransferAddress(const PathSelector& selector) const = 0;

    /**
     * @brief The ssh command the transfer tool needs to reach this location.
     *
     * @return std::vector<std::string> The command, or an empty vector for local locations.
     */
    virtual std::vector<std::string> sshTransport() const { return {}; }

    /**
     * @brief Creates the directory a transfer writes into, including missing parents.
     *
     * The transfer tool only creates the last component of a destination directory.
     *
     * @param directory Receiving directory, relative to the location's transfer root. Must be
     *        a directory selector or the whole tree.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> prepareDirectory(const PathSelector& directory) = 0;
};

/**
 * @brief A location backups read from and restores write to.
 */
class Source : public Location {};

/**
 * @brief A location backups write snapshots to and restores read from.
 *
 * Transfer addresses of targets always go through the "latest" snapshot link.
 */
class Target : public Location {
public:
    /**
     * @brief Creates a snapshot and points "latest" at it.
     *
     * @param name Snapshot name.
     * @return std::expected<void, std::string> Success or an error message.
     * @see createLocalSnapshot()
     */
    virtual std::expected<void, std::string> snapshot(const std::string& name) = 0;
};

/**
 * @brief A source on the local filesystem.
 */
class PathSource : public Source {
public:
    PathSource(Notifier& notifier, std::filesystem::path path);

    bool isAvailable() override;
    std::string toTransferAddress(const PathSelector& selector) const override;
    std::expected<void, std::string> prepareDirectory(const PathSelector& directory) override;

    const std::filesystem::path& path() const { return path_; }

private:
    Notifier& notifier_;
    std::filesystem::path path_;
};

/**
 * @brief A target on the local filesystem.
 */
class PathTarget : public Target {
public:
    PathTarget(Notifier& notifier, std::filesystem::path path);

    bool isAvailable() override;
    std::string toTransferAddress(const PathSelector& selector) const override;
    std::expected<void, std::string> prepareDirectory(const PathSelector& directory) override;
    std::expected<void, std::string> snapshot(const std::string& name) override;

    const std::filesystem::path& path() const { return path_; }

private:
    Notifier& notifier_;
    std::filesystem::path path_;
};

/**
 * @brief A source on a remote host, reached over SSH.
 */
class SshSource : public Source {
public:
    SshSource(Notifier& notifier, SshEndpoint endpoint);

    bool isAvailable() override;
    std::string toTransferAddress(const PathSelector& selector) const override;
    std::vector<std::string> sshTransport() const override;
    std::expected<void, std::string> prepareDirectory(const PathSelector& directory) override;

    const SshEndpoint& endpoint() const { return endpoint_; }

private:
    Notifier& notifier_;
    SshEndpoint endpoint_;
};

/**
 * @brief A target on a remote host, reached over SSH.
 *
 * Snapshots are created by running a shell command on the remote host.
 */
class SshTarget : public Target {
public:
    SshTarget(Notifier& notifier, SshEndpoint endpoint);

    bool isAvailable() override;
    std::string toTransferAddress(const PathSelector& selector) const override;
    std::vector<std::string> sshTransport() const override;
    std::expected<void, std::string> prepareDirectory(const PathSelector& directory) override;
    std::expected<void, std::string> snapshot(const std::string& name) override;

    const SshEndpoint& endpoint() const { return endpoint_; }

private:
    Notifier& notifier_;
    SshEndpoint endpoint_;
};

/**
 * @brief A target that uses the first available of several candidate targets.
 *
 * Candidates are probed in the order they were given. The first one found available is
 * remembered and used from then on without probing again. Failures are not remembered: while
 * no candidate has been found, every availability check probes all of them from the start.
 *
 * @note Not safe for concurrent use; availability checks mutate the resolved candidate.
 */
class FirstAvailableTarget : public Target {
public:
    /**
     * @brief Constructs a selector over candidate targets.
     *
     * @param targets Candidates, in order of preference.
     * @throws std::invalid_argument If no candidates are given.
     */
    explicit FirstAvailableTarget(std::vector<std::unique_ptr<Target>> targets);

    bool isAvailable() override;

    /**
     * @throws std::logic_error If no candidate has been resolved yet.
     */
    std::string toTransferAddress(const PathSelector& selector) const override;

    /**
     * @throws std::logic_error If no candidate has been resolved yet.
     */
    std::vector<std::string> sshTransport() const override;

    /**
     * @throws std::logic_error If no candidate has been resolved yet.
     */
    std::expected<void, std::string> prepareDirectory(const PathSelector& directory) override;

    /**
     * @throws std::logic_error If no candidate has been resolved yet.
     */
    std::expected<void, std::string> snapshot(const std::string& name) override;

    const std::vector<std::unique_ptr<Target>>& targets() const { return targets_; }

    /**
     * @brief The resolved candidate, or nullptr if none has been found yet.
     */
    Target* resolved() const { return resolved_; }

private:
    Target& resolvedTarget() const;

    std::vector<std::unique_ptr<Target>> targets_;
    Target* resolved_ = nullptr;
};

#endif // LOCATION_HPP
