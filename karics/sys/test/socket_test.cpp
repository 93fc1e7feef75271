#include "karics/socket.hpp"

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string_view>
#include <system_error>

#include "karics/base-fd.hpp"
#include "karics/platform.hpp"
#include "karics/socket-ops.hpp"

namespace karics {

namespace {

sockaddr_in Loopback(uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  return addr;
}

}  // namespace

TEST(Socket, BindEphemeralPort) {
  Socket sock(Socket::Type::StreamNonBlock);
  ASSERT_TRUE(sock);
  const uint16_t port = sock.bindAndListen(Loopback(0), false, 16);
  EXPECT_NE(port, 0);
  EXPECT_EQ(GetLocalPort(sock.fd()), port);
}

TEST(Socket, BindAddressInUseThrows) {
  Socket first(Socket::Type::StreamNonBlock);
  const uint16_t port = first.bindAndListen(Loopback(0), false, 16);

  Socket second(Socket::Type::StreamNonBlock);
  EXPECT_THROW(second.bindAndListen(Loopback(port), false, 16), std::system_error);
}

TEST(Socket, ReusePortAllowsSharedBind) {
  Socket first(Socket::Type::StreamNonBlock);
  const uint16_t port = first.bindAndListen(Loopback(0), true, 16);

  Socket second(Socket::Type::StreamNonBlock);
  EXPECT_EQ(second.bindAndListen(Loopback(port), true, 16), port);
}

TEST(Socket, CloseReleasesFd) {
  Socket sock(Socket::Type::Stream);
  ASSERT_TRUE(sock);
  sock.close();
  EXPECT_FALSE(sock);
}

TEST(SocketOps, AcceptSendRecvRoundTrip) {
  Socket listener(Socket::Type::StreamNonBlock);
  const uint16_t port = listener.bindAndListen(Loopback(0), false, 16);

  EXPECT_EQ(AcceptNonBlocking(listener.fd()), kInvalidHandle);
  EXPECT_TRUE(errno == EAGAIN || errno == EWOULDBLOCK);

  Socket client(Socket::Type::Stream);
  const sockaddr_in addr = Loopback(port);
  ASSERT_EQ(::connect(client.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)), 0);

  NativeHandle accepted = kInvalidHandle;
  for (int attempt = 0; attempt < 1000 && accepted == kInvalidHandle; ++attempt) {
    accepted = AcceptNonBlocking(listener.fd());
  }
  ASSERT_NE(accepted, kInvalidHandle);
  BaseFd acceptedFd(accepted);
  EXPECT_TRUE(SetTcpNoDelay(accepted));
  EXPECT_EQ(GetSocketError(accepted), 0);

  ASSERT_EQ(SafeSend(client.fd(), std::string_view("ping")), 4);
  char buf[8];
  int64_t nbRead = -1;
  for (int attempt = 0; attempt < 100000 && nbRead <= 0; ++attempt) {
    nbRead = SafeRecv(accepted, buf, sizeof(buf));
  }
  ASSERT_EQ(nbRead, 4);
  EXPECT_EQ(std::string_view(buf, 4), "ping");

  EXPECT_TRUE(ShutdownWrite(client.fd()));
  nbRead = -1;
  for (int attempt = 0; attempt < 100000 && nbRead < 0; ++attempt) {
    nbRead = SafeRecv(accepted, buf, sizeof(buf));
  }
  EXPECT_EQ(nbRead, 0);
}

TEST(SocketOps, ResolveIPv4) {
  sockaddr_in addr{};
  ASSERT_TRUE(ResolveIPv4("127.0.0.1", addr));
  EXPECT_EQ(addr.sin_addr.s_addr, htonl(INADDR_LOOPBACK));
  ASSERT_TRUE(ResolveIPv4("0.0.0.0", addr));
  EXPECT_EQ(addr.sin_addr.s_addr, htonl(INADDR_ANY));
}

}  // namespace karics
