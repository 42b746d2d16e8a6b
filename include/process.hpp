/**
 * @file process.hpp
 * @brief External command execution for LinkVault.
 *
 * The transfer tool, the hardlink copy and command notifiers all run as child processes.
 * Commands are passed as argument vectors and never go through a shell.
 */

#ifndef PROCESS_HPP
#define PROCESS_HPP

#include <expected>
#include <functional>
#include <string>
#include <vector>

/**
 * @brief Signature of a command runner.
 *
 * Receives the full argument vector (program first) and returns the child's exit status,
 * or an error message if the child could not be started or waited for.
 */
using CommandRunner = std::function<std::expected<int, std::string>(const std::vector<std::string>&)>;

/**
 * @brief Runs a command and waits for it to finish.
 *
 * The program is looked up in PATH. A program that cannot be executed yields exit status 127.
 *
 * @param argv Program followed by its arguments.
 * @return std::expected<int, std::string> The exit status or an error message.
 */
std::expected<int, std::string> runCommand(const std::vector<std::string>& argv);

/**
 * @brief Quotes a single word for a POSIX shell.
 *
 * Words made only of safe characters are returned unchanged.
 */
std::string shellQuote(const std::string& word);

/**
 * @brief Renders an argument vector as a shell-quoted command line, for logs and for rsync's -e.
 */
std::string formatCommand(const std::vector<std::string>& argv);

#endif // PROCESS_HPP
