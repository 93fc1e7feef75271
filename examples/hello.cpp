#include <karics/karics.hpp>
#include <karics/log.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

using namespace karics;

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

  // Enable signal handler for graceful shutdown on Ctrl+C
  SignalHandler::Enable();

  try {
    Router router;
    router.get("/hello", RouteHandler([](const RouteParams &) {
                 return HttpResponse::Text(http::StatusCodeOK, "Hello from karics!\n");
               }));
    router.get("/", RequestRouteHandler([](const HttpRequest &req, const RouteParams &) {
                 HttpResponse resp(http::StatusCodeOK);
                 resp.contentType(http::ContentTypeTextPlain);
                 resp.appendBody("You requested ");
                 resp.appendBody(req.path());
                 resp.appendBody("\nVersion: ");
                 resp.appendBody(req.version().str());
                 resp.appendBody("\nHeaders:\n");
                 for (const auto &[headerKey, headerValue] : req.headers()) {
                   resp.appendBody(headerKey);
                   resp.appendBody(": ");
                   resp.appendBody(headerValue);
                   resp.appendBody("\n");
                 }
                 return resp;
               }));

    HttpServer server(HttpServerConfig{}, std::move(router));
    ServerHandle handle = server.start(address);
    std::cout << "Server listening on port " << handle.port() << '\n';
    handle.join();  // blocking until Ctrl+C
  } catch (const std::exception &e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
