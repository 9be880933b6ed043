#include <gtest/gtest.h>
#include "command_runner.hpp"
#include "test_helpers.hpp"

using namespace testing_support;

class CommandRunnerTest : public ::testing::Test {
protected:
    TempDir tmp_;
    PosixCommandRunner runner_;
};

TEST_F(CommandRunnerTest, RedirectsStdoutToFile) {
    CommandSpec command;
    command.argv = {"sh", "-c", "echo snapshot"};
    command.stdoutFile = (tmp_ / "out.txt").string();

    auto result = runner_.run(command);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(readFile(tmp_ / "out.txt"), "snapshot\n");
}

TEST_F(CommandRunnerTest, FeedsStdinFromFile) {
    writeFile(tmp_ / "in.sql", "SELECT 1;\n");
    CommandSpec command;
    command.argv = {"cat"};
    command.stdinFile = (tmp_ / "in.sql").string();
    command.stdoutFile = (tmp_ / "copy.sql").string();

    ASSERT_TRUE(runner_.run(command).has_value());
    EXPECT_EQ(readFile(tmp_ / "copy.sql"), "SELECT 1;\n");
}

TEST_F(CommandRunnerTest, NonZeroExitIsFailure) {
    CommandSpec command;
    command.argv = {"sh", "-c", "exit 3"};
    auto result = runner_.run(command);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), "sh exited with status 3");
}

TEST_F(CommandRunnerTest, MissingProgramIsFailure) {
    CommandSpec command;
    command.argv = {"respondervault-no-such-program"};
    auto result = runner_.run(command);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("Failed to start respondervault-no-such-program"), std::string::npos);
}

// Input redirection failures are reported before anything is spawned
TEST_F(CommandRunnerTest, MissingStdinFileIsFailure) {
    CommandSpec command;
    command.argv = {"cat"};
    command.stdinFile = (tmp_ / "absent.sql").string();
    auto result = runner_.run(command);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("absent.sql"), std::string::npos);
}

TEST_F(CommandRunnerTest, EmptyCommandIsFailure) {
    EXPECT_FALSE(runner_.run(CommandSpec{}).has_value());
}
