#include "debug/ChildProcess.hpp"
#include "debug/FdIo.hpp"
#include <gtest/gtest.h>
#include <csignal>

using namespace upnote_mcp;

TEST(ChildProcessTest, EchoesThroughPipes) {
    ChildProcess child({"cat"});

    ASSERT_TRUE(write_all(child.stdin_fd(), "{\"id\":1}\n"));
    child.close_stdin();

    FdReader reader(child.stdout_fd());
    auto line = reader.read_line();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "{\"id\":1}\n");
    EXPECT_FALSE(reader.read_line().has_value());
    EXPECT_EQ(child.wait(), 0);
}

TEST(ChildProcessTest, ReportsExitCode) {
    ChildProcess child({"sh", "-c", "echo oops >&2; exit 3"});

    FdReader reader(child.stderr_fd());
    auto line = reader.read_line();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "oops\n");
    EXPECT_EQ(child.wait(), 3);
}

TEST(ChildProcessTest, ExecFailure) {
    ChildProcess child({"/nonexistent/upnote-mcp-server"});

    EXPECT_EQ(child.wait(), ChildProcess::kExecFailedStatus);
}

TEST(ChildProcessTest, EmptyCommandRejected) {
    EXPECT_THROW(ChildProcess(std::vector<std::string>{}), std::invalid_argument);
}

TEST(ChildProcessTest, TryWaitWhileRunning) {
    ChildProcess child({"cat"});

    EXPECT_FALSE(child.try_wait().has_value());
    child.close_stdin();
    child.close_stdin();
    EXPECT_EQ(child.wait(), 0);
    EXPECT_EQ(child.try_wait().value_or(-1), 0);
}

TEST(ChildProcessTest, TerminateSendsSigterm) {
    ChildProcess child({"sleep", "30"});

    EXPECT_EQ(child.terminate(std::chrono::milliseconds(2000)), 128 + SIGTERM);
}

TEST(ChildProcessTest, TerminateEscalatesToSigkill) {
    ChildProcess child({"sh", "-c", "trap '' TERM; echo ready; while true; do sleep 1; done"});

    FdReader reader(child.stdout_fd());
    ASSERT_TRUE(reader.read_line().has_value());
    EXPECT_EQ(child.terminate(std::chrono::milliseconds(200)), 128 + SIGKILL);
}
