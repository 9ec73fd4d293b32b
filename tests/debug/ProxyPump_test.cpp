#include "debug/ProxyPump.hpp"
#include "CapturedLog.hpp"
#include "PipeFixture.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <csignal>
#include <thread>

using namespace upnote_mcp;

class ProxyPumpTest : public TempDirTest {
protected:
    CapturedLog captured;
    TestPipe source;
    TestPipe destination;
};

TEST_F(ProxyPumpTest, ForwardsEveryByteAndTees) {
    std::string body = "{\"jsonrpc\":\"2.0\",\"id\":7,\"method\":\"tools/call\",\"params\":{\"name\":\"search_notes\","
                       "\"arguments\":{\"query\":\"" + std::string(200, 'q') + "\"}}}";
    std::string frame = "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;

    ProxyPump pump("C->S", source.read_fd, destination.write_fd, dir / "tee.bin", captured.log);
    std::atomic<bool> closed{false};
    pump.on_source_closed([&closed]() { closed = true; });

    source.feed_and_close(frame);
    std::size_t forwarded = pump.run();
    destination.close_write();

    EXPECT_EQ(forwarded, frame.size());
    EXPECT_EQ(pump.bytes_forwarded(), frame.size());
    EXPECT_TRUE(closed);
    EXPECT_EQ(destination.read_all(), frame);
    EXPECT_EQ(read_file(dir / "tee.bin"), frame);
    EXPECT_TRUE(captured.contains("[C->S      ] JSON message summary: method=\"tools/call\", id=7"));
}

TEST_F(ProxyPumpTest, GarbageIsForwardedUnchanged) {
    std::string garbage = "not json at all\n\x01\x02{broken\n";

    ProxyPump pump("S->C", source.read_fd, destination.write_fd, dir / "tee.bin", captured.log);
    source.feed_and_close(garbage);
    pump.run();
    destination.close_write();

    EXPECT_EQ(destination.read_all(), garbage);
    EXPECT_EQ(read_file(dir / "tee.bin"), garbage);
}

TEST_F(ProxyPumpTest, StopReleasesIdlePump) {
    ProxyPump pump("C->S", source.read_fd, destination.write_fd, dir / "tee.bin", captured.log);
    bool closed = false;
    pump.on_source_closed([&closed]() { closed = true; });

    std::thread runner([&pump]() { pump.run(); });
    pump.stop();
    runner.join();

    EXPECT_FALSE(closed);
    EXPECT_EQ(pump.bytes_forwarded(), 0u);
}

TEST_F(ProxyPumpTest, StopStillDrainsAvailableBytes) {
    ProxyPump pump("S->C", source.read_fd, destination.write_fd, dir / "tee.bin", captured.log);
    std::string reply = "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}\n";

    ASSERT_EQ(::write(source.write_fd, reply.data(), reply.size()), static_cast<ssize_t>(reply.size()));
    pump.stop();
    pump.run();
    destination.close_write();

    EXPECT_EQ(destination.read_all(), reply);
}

TEST_F(ProxyPumpTest, WriteFailureEndsPump) {
    std::signal(SIGPIPE, SIG_IGN);
    ProxyPump pump("S->C", source.read_fd, destination.write_fd, dir / "tee.bin", captured.log);
    destination.close_read();

    source.feed_and_close("{}\n");
    pump.run();

    EXPECT_EQ(pump.bytes_forwarded(), 0u);
    EXPECT_TRUE(captured.contains("Pump error [S->C]: write failed"));
}
