#include "remote_shell.hpp"
#include <format>
#include <libssh/libssh.h>

namespace {

void closeSession(ssh_session ssh) {
    if (ssh_is_connected(ssh)) {
        ssh_disconnect(ssh);
    }
    ssh_free(ssh);
}

// Returns a connected and authenticated session. The caller owns it.
std::expected<ssh_session, std::string> openSession(const SshEndpoint& endpoint) {
    ssh_session ssh = ssh_new();
    if (!ssh) {
        return std::unexpected("Failed to create SSH session");
    }

    unsigned int port = endpoint.port;
    long timeout = kSshConnectTimeoutSeconds;
    int strict = 1;
    ssh_options_set(ssh, SSH_OPTIONS_HOST, endpoint.host.c_str());
    ssh_options_set(ssh, SSH_OPTIONS_PORT, &port);
    ssh_options_set(ssh, SSH_OPTIONS_USER, endpoint.user.c_str());
    ssh_options_set(ssh, SSH_OPTIONS_TIMEOUT, &timeout);
    ssh_options_set(ssh, SSH_OPTIONS_STRICTHOSTKEYCHECK, &strict);
    if (endpoint.knownHosts) {
        ssh_options_set(ssh, SSH_OPTIONS_KNOWNHOSTS, endpoint.knownHosts->c_str());
    }
    if (endpoint.identity) {
        ssh_options_set(ssh, SSH_OPTIONS_ADD_IDENTITY, endpoint.identity->c_str());
    }

    if (ssh_connect(ssh) != SSH_OK) {
        std::string error = std::format("Could not connect to {}:{}: {}", endpoint.host, endpoint.port, ssh_get_error(ssh));
        closeSession(ssh);
        return std::unexpected(error);
    }

    enum ssh_known_hosts_e known = ssh_session_is_known_server(ssh);
    if (known != SSH_KNOWN_HOSTS_OK) {
        std::string reason;
        switch (known) {
            case SSH_KNOWN_HOSTS_CHANGED:
                reason = "the host key has changed";
                break;
            case SSH_KNOWN_HOSTS_OTHER:
                reason = "the host key type has changed";
                break;
            case SSH_KNOWN_HOSTS_UNKNOWN:
            case SSH_KNOWN_HOSTS_NOT_FOUND:
                reason = "the host key is not known";
                break;
            default:
                reason = ssh_get_error(ssh);
                break;
        }
        closeSession(ssh);
        return std::unexpected(std::format("Rejected host key of {}:{}: {}", endpoint.host, endpoint.port, reason));
    }

    if (ssh_userauth_publickey_auto(ssh, nullptr, nullptr) != SSH_AUTH_SUCCESS) {
        std::string error = std::format("SSH authentication as {} on {} failed: {}", endpoint.user, endpoint.host, ssh_get_error(ssh));
        closeSession(ssh);
        return std::unexpected(error);
    }

    return ssh;
}

}

std::expected<void, std::string> probeSshEndpoint(const SshEndpoint& endpoint) {
    auto ssh = openSession(endpoint);
    if (!ssh) {
        return std::unexpected(ssh.error());
    }
    closeSession(*ssh);
    return {};
}

std::expected<int, std::string> runRemoteCommand(const SshEndpoint& endpoint, const std::string& command) {
    auto ssh = openSession(endpoint);
    if (!ssh) {
        return std::unexpected(ssh.error());
    }

    ssh_channel channel = ssh_channel_new(*ssh);
    if (!channel) {
        closeSession(*ssh);
        return std::unexpected("Failed to create SSH channel");
    }
    if (ssh_channel_open_session(channel) != SSH_OK) {
        std::string error = std::format("Failed to open SSH channel: {}", ssh_get_error(*ssh));
        ssh_channel_free(channel);
        closeSession(*ssh);
        return std::unexpected(error);
    }
    if (ssh_channel_request_exec(channel, command.c_str()) != SSH_OK) {
        std::string error = std::format("Failed to execute remote command: {}", ssh_get_error(*ssh));
        ssh_channel_close(channel);
        ssh_channel_free(channel);
        closeSession(*ssh);
        return std::unexpected(error);
    }

    // Drain stdout, then stderr.
    char buf[4096];
    for (int isStderr = 0; isStderr <= 1; ++isStderr) {
        while (ssh_channel_read(channel, buf, sizeof(buf), isStderr) > 0) {
        }
    }

    ssh_channel_send_eof(channel);
    int status = ssh_channel_get_exit_status(channel);
    ssh_channel_close(channel);
    ssh_channel_free(channel);
    closeSession(*ssh);
    if (status < 0) {
        return std::unexpected("The remote command did not report an exit status");
    }
    return status;
}

std::vector<std::string> sshTransportArgs(const SshEndpoint& endpoint) {
    std::vector<std::string> args = {"ssh", "-l", endpoint.user, "-p", std::to_string(endpoint.port)};
    if (endpoint.identity) {
        args.push_back("-i");
        args.push_back(*endpoint.identity);
    }
    args.push_back("-o");
    args.push_back("StrictHostKeyChecking=yes");
    if (endpoint.knownHosts) {
        args.push_back("-o");
        args.push_back("UserKnownHostsFile=" + *endpoint.knownHosts);
    }
    return args;
}
