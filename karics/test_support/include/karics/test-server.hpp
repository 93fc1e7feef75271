#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <utility>

#include "karics/http-server-config.hpp"
#include "karics/http-server.hpp"
#include "karics/http-service.hpp"
#include "karics/router.hpp"

namespace karics::test {

// RAII test server on an ephemeral loopback port.
//
// Usage pattern:
//   Router router;
//   router.get("/hello", [](const RouteParams&) { return HttpResponse::Text(200, "hi"); });
//   TestServer ts(HttpServerConfig{}, std::move(router));
//   auto raw = requestOrThrow(ts.port());
//   // automatic stop at scope end (or call ts.stop() early)
struct TestServer {
  static constexpr std::chrono::milliseconds kPollInterval{10};

  TestServer(HttpServerConfig cfg, std::shared_ptr<const HttpServiceFactory> factory)
      : server(std::move(cfg.withPollInterval(kPollInterval)), std::move(factory)),
        handle(server.start("127.0.0.1:0")) {}

  TestServer(HttpServerConfig cfg, Router router)
      : server(std::move(cfg.withPollInterval(kPollInterval)), std::move(router)),
        handle(server.start("127.0.0.1:0")) {}

  TestServer(const TestServer&) = delete;
  TestServer(TestServer&&) noexcept = delete;
  TestServer& operator=(const TestServer&) = delete;
  TestServer& operator=(TestServer&&) noexcept = delete;

  ~TestServer() { stop(); }

  [[nodiscard]] uint16_t port() const noexcept { return handle.port(); }

  void stop() noexcept { handle.stop(); }

  HttpServer server;
  ServerHandle handle;
};

}  // namespace karics::test
