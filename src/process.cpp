#include "process.hpp"
#include <cerrno>
#include <cstring>
#include <format>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

std::expected<int, std::string> runCommand(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return std::unexpected("Cannot run an empty command");
    }

    std::vector<std::string> words = argv;
    std::vector<char*> args;
    for (auto& word : words) {
        args.push_back(word.data());
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        return std::unexpected(std::format("Failed to fork for {}: {}", argv[0], strerror(errno)));
    }
    if (pid == 0) {
        execvp(args[0], args.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(std::format("Failed to wait for {}: {}", argv[0], strerror(errno)));
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

std::string shellQuote(const std::string& word) {
    if (word.empty()) {
        return "''";
    }
    bool safe = true;
    for (char c : word) {
        bool plain = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
            || c == '/' || c == '.' || c == '_' || c == '-' || c == '=' || c == ':' || c == '@' || c == ',' || c == '+';
        if (!plain) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return word;
    }

    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string formatCommand(const std::vector<std::string>& argv) {
    std::string line;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            line += ' ';
        }
        line += shellQuote(argv[i]);
    }
    return line;
}
