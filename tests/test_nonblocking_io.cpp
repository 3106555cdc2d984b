#include <gtest/gtest.h>
#include <platform/nonblocking_io.hpp>
#include <fcntl.h>
#include <unistd.h>
#include <string>

class PipeTest : public ::testing::Test {
protected:
    int rd_ = -1;
    int wr_ = -1;

    void SetUp() override {
        int fds[2];
        ASSERT_EQ(pipe(fds), 0);
        rd_ = fds[0];
        wr_ = fds[1];
    }

    void TearDown() override {
        if (rd_ >= 0) close(rd_);
        if (wr_ >= 0) close(wr_);
    }
};

TEST_F(PipeTest, EmptyNonBlockingReadWouldBlock) {
    platform::NonBlockingScope scope(rd_);
    ASSERT_TRUE(scope.ok());
    char buf[16];
    auto r = platform::read_nonblocking(rd_, buf, sizeof(buf));
    EXPECT_EQ(r.status, platform::IoStatus::WOULD_BLOCK);
}

TEST_F(PipeTest, ReadsAvailableData) {
    platform::NonBlockingScope scope(rd_);
    ASSERT_EQ(write(wr_, "hello", 5), 5);
    char buf[16];
    auto r = platform::read_nonblocking(rd_, buf, sizeof(buf));
    ASSERT_EQ(r.status, platform::IoStatus::DATA);
    EXPECT_EQ(std::string(buf, r.n), "hello");
}

TEST_F(PipeTest, ClosedWriterIsEndOfFile) {
    close(wr_);
    wr_ = -1;
    char buf[16];
    auto r = platform::read_nonblocking(rd_, buf, sizeof(buf));
    EXPECT_EQ(r.status, platform::IoStatus::END_OF_FILE);
}

TEST_F(PipeTest, ScopeRestoresFlags) {
    int before = fcntl(rd_, F_GETFL);
    {
        platform::NonBlockingScope scope(rd_);
        EXPECT_TRUE(fcntl(rd_, F_GETFL) & O_NONBLOCK);
    }
    EXPECT_EQ(fcntl(rd_, F_GETFL), before);
}

TEST_F(PipeTest, WriteAllDeliversEverything) {
    std::string payload(1000, 'x');
    auto w = platform::write_all(wr_, payload.data(), payload.size(), 1000);
    ASSERT_TRUE(w.is_ok()) << w.error.message;
    std::string got(payload.size(), '\0');
    ASSERT_EQ(read(rd_, &got[0], got.size()), static_cast<ssize_t>(got.size()));
    EXPECT_EQ(got, payload);
}

TEST_F(PipeTest, WriteAllTimesOutOnAFullPipe) {
    platform::set_nonblocking(wr_);
    std::string chunk(1 << 20, 'y');   // larger than any pipe buffer
    auto w = platform::write_all(wr_, chunk.data(), chunk.size(), 50);
    ASSERT_TRUE(w.is_err());
    EXPECT_EQ(w.error.kind, ErrorKind::IO);
}

TEST_F(PipeTest, WaitReadable) {
    EXPECT_FALSE(platform::wait_readable(rd_, 10));
    ASSERT_EQ(write(wr_, "z", 1), 1);
    EXPECT_TRUE(platform::wait_readable(rd_, 10));
}
