#include "floodgate/transport.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>

#include <string>

#include "floodgate/base-fd.hpp"

namespace floodgate {

namespace {
struct SocketPair {
  SocketPair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK, 0, fds) == 0) {
      lhs = BaseFd(fds[0]);
      rhs = BaseFd(fds[1]);
    }
  }
  BaseFd lhs;
  BaseFd rhs;
};
}  // namespace

TEST(PlainTransport, ReadWouldBlock) {
  SocketPair pair;
  PlainTransport transport(pair.lhs.fd());
  char buf[16];
  const auto [nb, want] = transport.read(buf, sizeof(buf));
  EXPECT_EQ(nb, 0U);
  EXPECT_EQ(want, TransportHint::ReadReady);
}

TEST(PlainTransport, ReadOrderlyClose) {
  SocketPair pair;
  PlainTransport transport(pair.lhs.fd());
  pair.rhs.close();
  char buf[16];
  const auto [nb, want] = transport.read(buf, sizeof(buf));
  EXPECT_EQ(nb, 0U);
  EXPECT_EQ(want, TransportHint::None);
}

TEST(PlainTransport, PartialWriteOnFullBuffer) {
  SocketPair pair;
  int small = 4096;
  ASSERT_EQ(0, ::setsockopt(pair.lhs.fd(), SOL_SOCKET, SO_SNDBUF, &small, sizeof(small)));
  PlainTransport transport(pair.lhs.fd());
  const std::string big(1 << 22, 'x');
  const auto [nb, want] = transport.write(big);
  EXPECT_LT(nb, big.size());
  EXPECT_EQ(want, TransportHint::WriteReady);
}

TEST(PlainTransport, WriteToClosedPeerIsError) {
  SocketPair pair;
  PlainTransport transport(pair.lhs.fd());
  pair.rhs.close();
  const auto [nb, want] = transport.write("data");
  EXPECT_EQ(nb, 0U);
  EXPECT_EQ(want, TransportHint::Error);
}

}  // namespace floodgate
