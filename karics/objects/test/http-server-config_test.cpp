#include "karics/http-server-config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

namespace karics {

using namespace std::chrono_literals;

TEST(HttpServerConfig, DefaultIsValid) {
  HttpServerConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_FALSE(config.reusePort);
  EXPECT_TRUE(config.enableKeepAlive);
  EXPECT_EQ(config.maxRequestsPerConnection, 0U);
  EXPECT_EQ(config.serverName, "Karics");
  EXPECT_EQ(config.globalHeaders.size(), 2U);
}

TEST(HttpServerConfig, BuildersChain) {
  HttpServerConfig config;
  config.withNbThreads(3)
      .withReusePort()
      .withTcpNoDelay()
      .withKeepAliveMode(false)
      .withMaxRequestsPerConnection(7)
      .withKeepAliveTimeout(250ms)
      .withHeaderReadTimeout(100ms)
      .withPollInterval(20ms)
      .withMaxDrainPeriod(1s)
      .withMaxRequestLineBytes(1024)
      .withMaxHeaderBytes(2048)
      .withMaxHeaderCount(10)
      .withMaxBodyBytes(4096)
      .withServerName("test-server")
      .withDateHeader(false)
      .withoutGlobalHeaders()
      .withGlobalHeader("X-Test", "yes");

  EXPECT_EQ(config.nbThreads, 3U);
  EXPECT_TRUE(config.reusePort);
  EXPECT_TRUE(config.tcpNoDelay);
  EXPECT_FALSE(config.enableKeepAlive);
  EXPECT_EQ(config.maxRequestsPerConnection, 7U);
  EXPECT_EQ(config.keepAliveTimeout, 250ms);
  EXPECT_EQ(config.headerReadTimeout, 100ms);
  EXPECT_EQ(config.pollInterval, 20ms);
  EXPECT_EQ(config.maxDrainPeriod, 1s);
  EXPECT_EQ(config.maxRequestLineBytes, 1024U);
  EXPECT_EQ(config.maxHeaderBytes, 2048U);
  EXPECT_EQ(config.maxHeaderCount, 10U);
  EXPECT_EQ(config.maxBodyBytes, 4096U);
  EXPECT_EQ(config.serverName, "test-server");
  EXPECT_FALSE(config.addDateHeader);
  ASSERT_EQ(config.globalHeaders.size(), 1U);
  EXPECT_EQ(config.globalHeaders.front().name, "X-Test");
  EXPECT_NO_THROW(config.validate());
}

TEST(HttpServerConfig, ResolvedNbThreads) {
  HttpServerConfig config;
  EXPECT_GE(config.resolvedNbThreads(), 1U);
  config.withNbThreads(5);
  EXPECT_EQ(config.resolvedNbThreads(), 5U);
}

TEST(HttpServerConfig, InvalidLimits) {
  EXPECT_THROW(HttpServerConfig{}.withMaxRequestLineBytes(4).validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withMaxHeaderBytes(64).validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withMaxHeaderBytes(512).withMaxRequestLineBytes(1024).validate(),
               std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withMaxHeaderCount(0).validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withMaxBodyBytes(0).validate(), std::invalid_argument);
}

TEST(HttpServerConfig, InvalidDurations) {
  EXPECT_THROW(HttpServerConfig{}.withKeepAliveTimeout(-1ms).validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withHeaderReadTimeout(-1ms).validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withMaxDrainPeriod(-1ms).validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withPollInterval(0ms).validate(), std::invalid_argument);
  EXPECT_NO_THROW(HttpServerConfig{}.withKeepAliveTimeout(0ms).withHeaderReadTimeout(0ms).validate());
}

TEST(HttpServerConfig, InvalidListenBacklog) {
  HttpServerConfig config;
  config.listenBacklog = 0;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(HttpServerConfig, InvalidServerName) {
  EXPECT_THROW(HttpServerConfig{}.withServerName("bad\r\nname").validate(), std::invalid_argument);
  EXPECT_NO_THROW(HttpServerConfig{}.withServerName("").validate());
}

TEST(HttpServerConfig, InvalidGlobalHeaders) {
  EXPECT_THROW(HttpServerConfig{}.withGlobalHeader("Bad Name", "v").validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withGlobalHeader("X-Ok", "bad\nvalue").validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withGlobalHeader("content-length", "3").validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withGlobalHeader("Connection", "close").validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withGlobalHeader("Transfer-Encoding", "chunked").validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withGlobalHeader("DATE", "now").validate(), std::invalid_argument);
  EXPECT_NO_THROW(HttpServerConfig{}.withGlobalHeader("Cache-Control", "no-store").validate());
}

}  // namespace karics
