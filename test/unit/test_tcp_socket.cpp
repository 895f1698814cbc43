#include "rolodex/core/tcp_socket.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <string_view>
#include <vector>

using namespace rolodex;

namespace {

std::span<const uint8_t> bytes(std::string_view text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

class TcpSocketTest : public ::testing::Test {
protected:
    void SetUp() override {
        int fds[2];
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK, 0, fds), 0);
        left_ = tcp_socket(fds[0]);
        right_ = tcp_socket(fds[1]);
    }

    tcp_socket left_;
    tcp_socket right_;
};

} // namespace

TEST(TcpSocket, DefaultIsInvalid) {
    tcp_socket socket;
    EXPECT_FALSE(socket);
    EXPECT_EQ(socket.native_handle(), -1);
}

TEST(TcpSocket, OperationsOnInvalidSocketFail) {
    tcp_socket socket;
    uint8_t buffer[8];

    auto read = socket.read(buffer);
    ASSERT_FALSE(read);
    EXPECT_EQ(read.error(), make_error_code(error_code::invalid_fd));

    auto written = socket.write(bytes("x"));
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error(), make_error_code(error_code::invalid_fd));
}

TEST_F(TcpSocketTest, MoveLeavesSourceEmpty) {
    int fd = left_.native_handle();

    tcp_socket moved(std::move(left_));
    EXPECT_FALSE(left_);
    EXPECT_EQ(moved.native_handle(), fd);

    tcp_socket assigned;
    assigned = std::move(moved);
    EXPECT_FALSE(moved);
    EXPECT_EQ(assigned.native_handle(), fd);
}

TEST_F(TcpSocketTest, CloseIsIdempotent) {
    left_.close();
    left_.close();
    EXPECT_FALSE(left_);
}

TEST_F(TcpSocketTest, ReleaseHandsOverDescriptor) {
    int fd = left_.native_handle();
    int released = left_.release();

    EXPECT_EQ(released, fd);
    EXPECT_FALSE(left_);
    EXPECT_EQ(::close(released), 0);
}

TEST_F(TcpSocketTest, DestructorClosesDescriptor) {
    int fd = -1;
    {
        tcp_socket owner(std::move(left_));
        fd = owner.native_handle();
    }

    char c;
    EXPECT_EQ(::read(fd, &c, 1), -1);
    EXPECT_EQ(errno, EBADF);
}

TEST_F(TcpSocketTest, WriteThenRead) {
    auto written = right_.write(bytes("GET / HTTP/1.1\r\n"));
    ASSERT_TRUE(written);
    EXPECT_EQ(*written, 16u);

    uint8_t buffer[64];
    auto read = left_.read(buffer);
    ASSERT_TRUE(read);
    EXPECT_EQ(std::string_view(reinterpret_cast<const char*>(read->data()), read->size()),
              "GET / HTTP/1.1\r\n");
}

TEST_F(TcpSocketTest, ReadWouldBlockIsEmptySpan) {
    uint8_t buffer[64];
    auto read = left_.read(buffer);
    ASSERT_TRUE(read);
    EXPECT_TRUE(read->empty());
}

TEST_F(TcpSocketTest, PeerCloseIsConnectionClosed) {
    right_.close();

    uint8_t buffer[64];
    auto read = left_.read(buffer);
    ASSERT_FALSE(read);
    EXPECT_EQ(read.error(), make_error_code(error_code::connection_closed));
}

TEST_F(TcpSocketTest, WriteStopsWhenPeerBufferIsFull) {
    std::vector<uint8_t> payload(8 * 1024 * 1024, 'A');

    auto written = right_.write(payload);
    ASSERT_TRUE(written);
    EXPECT_GT(*written, 0u);
    EXPECT_LT(*written, payload.size());
}

TEST_F(TcpSocketTest, WriteToClosedPeerReportsError) {
    left_.close();

    auto written = right_.write(bytes("late"));
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error(), std::error_code(EPIPE, std::system_category()));
}
