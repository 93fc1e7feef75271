#include <karics/karics.hpp>
#include <karics/log.hpp>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

using namespace karics;

namespace {

// Shared by all the connections of all workers.
struct ApiStats {
  std::atomic<uint64_t> nbRequests{0};
};

// Per-connection service counting its requests in the shared context before routing them.
class UsersService : public RouterService {
 public:
  using RouterService::RouterService;

  HttpResponse call(const HttpRequest &request) override {
    if (ApiStats *stats = context<ApiStats>()) {
      stats->nbRequests.fetch_add(1, std::memory_order_relaxed);
    }
    ++_nbServed;
    HttpResponse response = RouterService::call(request);
    response.header("X-Connection-Requests", std::to_string(_nbServed));
    return response;
  }

 private:
  uint64_t _nbServed{0};
};

class UsersServiceFactory : public HttpServiceFactory {
 public:
  UsersServiceFactory(std::shared_ptr<const Router> router, std::shared_ptr<ApiStats> stats)
      : _router(std::move(router)), _context(std::move(stats)) {}

  [[nodiscard]] std::unique_ptr<HttpService> newService([[maybe_unused]] ConnectionId connectionId) const override {
    return std::make_unique<UsersService>(_router, _context, true);
  }

 private:
  std::shared_ptr<const Router> _router;
  ServiceContext _context;
};

Router MakeUsersRouter(const std::shared_ptr<ApiStats> &stats) {
  Router router;
  router.get("/users", RouteHandler([](const RouteParams &) {
               return HttpResponse::Json(http::StatusCodeOK, R"([{"id": 1, "name": "ada"}, {"id": 2, "name": "bob"}])");
             }));
  router.get(R"(/users/(\d+))", RouteHandler([](const RouteParams &params) {
               return HttpResponse::Json(http::StatusCodeOK, R"({"id": )" + params[0] + "}");
             }));
  router.get(R"(/users/(\d+)/posts/(\d+))", RouteHandler([](const RouteParams &params) {
               return HttpResponse::Json(http::StatusCodeOK,
                                         R"({"user": )" + params[0] + R"(, "post": )" + params[1] + "}");
             }));
  router.post("/users", RequestRouteHandler([](const HttpRequest &req, const RouteParams &) {
                if (req.body().empty()) {
                  return HttpResponse::Json(http::StatusCodeBadRequest, R"({"error": "empty body"})");
                }
                return HttpResponse::Json(http::StatusCodeCreated, req.body());
              }));
  router.get("/stats", RouteHandler([stats](const RouteParams &) {
               return HttpResponse::Json(http::StatusCodeOK,
                                         R"({"requests": )" + std::to_string(stats->nbRequests.load()) + "}");
             }));
  router.getWithStatus("/health", http::StatusCodeOK, "up");
  return router;
}

}  // namespace

int main(int argc, char **argv) {
  std::string address = ":8080";
  for (int argPos = 1; argPos < argc; ++argPos) {
    const std::string_view arg(argv[argPos]);
    if (arg == "--verbose") {
      log::set_level(log::level::debug);
    } else {
      address = arg;
    }
  }

  SignalHandler::Enable();

  try {
    auto stats = std::make_shared<ApiStats>();
    auto router = std::make_shared<const Router>(MakeUsersRouter(stats));
    auto factory = std::make_shared<const UsersServiceFactory>(std::move(router), stats);

    HttpServer server(HttpServerConfig{}.withServerName("karics-users"), std::move(factory));
    ServerHandle handle = server.start(address);
    std::cout << "Users API listening on port " << handle.port() << '\n';
    handle.join();
    std::cout << "Served " << stats->nbRequests.load() << " request(s)\n";
  } catch (const std::exception &e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
