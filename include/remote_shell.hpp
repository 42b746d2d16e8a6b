/**
 * @file remote_shell.hpp
 * @brief Secure-shell plumbing for remote locations.
 *
 * Provides the connection probe used for availability checks, remote command execution
 * used for snapshots, and the ssh transport command handed to the transfer tool.
 *
 * @note Requires libssh.
 */

#ifndef REMOTE_SHELL_HPP
#define REMOTE_SHELL_HPP

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Seconds to wait for a remote host before treating it as unavailable.
 */
constexpr long kSshConnectTimeoutSeconds = 9;

/**
 * @brief Connection details of a remote location.
 */
struct SshEndpoint {
    std::string user;                      ///< Remote user.
    std::string host;                      ///< Remote host name or address.
    std::uint16_t port = 22;               ///< Remote SSH port.
    std::string path;                      ///< Absolute root path on the remote host.
    std::optional<std::string> identity;   ///< Private key file, if not the default.
    std::optional<std::string> knownHosts; ///< known_hosts file, if not the default.
};

/**
 * @brief Connects to and authenticates with a remote host, then disconnects.
 *
 * The host key must be vouched for by the configured or default known_hosts files; unknown
 * or changed keys are rejected. Timeouts, connection failures, host key rejections and
 * authentication failures are all returned as errors, never thrown.
 *
 * @param endpoint Remote host to probe.
 * @return std::expected<void, std::string> Success or the reason the host is unavailable.
 */
std::expected<void, std::string> probeSshEndpoint(const SshEndpoint& endpoint);

/**
 * @brief Runs a shell command on a remote host.
 *
 * @param endpoint Remote host.
 * @param command Command line for the remote shell.
 * @return std::expected<int, std::string> The remote exit status, or an error message if the
 *         session could not be established.
 */
std::expected<int, std::string> runRemoteCommand(const SshEndpoint& endpoint, const std::string& command);

/**
 * @brief Builds the ssh command the transfer tool uses to reach a remote host.
 *
 * Host key checking is always strict.
 */
std::vector<std::string> sshTransportArgs(const SshEndpoint& endpoint);

#endif // REMOTE_SHELL_HPP
