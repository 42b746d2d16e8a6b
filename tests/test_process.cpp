// Process Test Suite
// Tests running external commands and rendering command lines

#include "process.hpp"
#include "test_support.hpp"

void test_exit_status_is_reported() {
    std::cout << "  test_exit_status_is_reported..." << std::endl;

    auto success = runCommand({"true"});
    ASSERT_TRUE(success.has_value());
    ASSERT_EQ(*success, 0);

    auto failure = runCommand({"sh", "-c", "exit 23"});
    ASSERT_TRUE(failure.has_value());
    ASSERT_EQ(*failure, 23);
}

void test_missing_program_exits_127() {
    std::cout << "  test_missing_program_exits_127..." << std::endl;

    auto result = runCommand({"linkvault-no-such-command"});
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(*result, 127);
    ASSERT_FALSE(runCommand({}).has_value());
}

void test_arguments_are_passed_verbatim() {
    std::cout << "  test_arguments_are_passed_verbatim..." << std::endl;

    TempDir dir;
    fs::path out = dir.path() / "args.txt";
    std::vector<std::string> argv = {"sh", "-c", "printf '%s|' \"$@\" > \"$0\"", out.string(), "two words", "it's", "$HOME", ""};

    auto result = runCommand(argv);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(*result, 0);
    ASSERT_EQ(readFile(out), "two words|it's|$HOME||");
    // The caller's argument vector is left untouched.
    ASSERT_EQ(argv[4], "two words");
}

void test_killed_child_reports_signal() {
    std::cout << "  test_killed_child_reports_signal..." << std::endl;

    auto result = runCommand({"sh", "-c", "kill -9 $$"});
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(*result, 128 + 9);
}

void test_shell_quoting() {
    std::cout << "  test_shell_quoting..." << std::endl;

    ASSERT_EQ(shellQuote("/var/backups/me"), "/var/backups/me");
    ASSERT_EQ(shellQuote("user@host:/path"), "user@host:/path");
    ASSERT_EQ(shellQuote(""), "''");
    ASSERT_EQ(shellQuote("my backups"), "'my backups'");
    ASSERT_EQ(shellQuote("it's"), "'it'\\''s'");
    ASSERT_EQ(formatCommand({"ssh", "-o", "UserKnownHostsFile=/home/me/known hosts"}),
              "ssh -o 'UserKnownHostsFile=/home/me/known hosts'");
}

int main() {
    std::cout << "Process tests" << std::endl;

    test_exit_status_is_reported();
    test_missing_program_exits_127();
    test_arguments_are_passed_verbatim();
    test_killed_child_reports_signal();
    test_shell_quoting();

    std::cout << "All Process tests passed" << std::endl;
    return 0;
}
