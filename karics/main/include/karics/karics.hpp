// karics Umbrella Header
//
// Include this single header to pull in the public HTTP server API:
//   - Server types (HttpServer, ServerHandle) and their configuration
//   - Routing (Router, RouterService, RouterServiceFactory)
//   - Per-connection services (HttpService, HttpServiceFactory, ServiceContext)
//   - Request / Response primitives and HTTP enums
//   - Coroutine primitives needed by asynchronous services (Task, Worker)
//
// Each re-exported header line is annotated with 'IWYU pragma: export' so that user code only including
// <karics/karics.hpp> is considered complete by include-cleaner tools.
//
// Usage Example:
//    #include <karics/karics.hpp>
//    using namespace karics;
//    int main() {
//      Router router;
//      router.get("/hello", RouteHandler([](const RouteParams&) { return HttpResponse::Text(200, "hi\n"); }));
//      HttpServer server(HttpServerConfig{}, std::move(router));
//      server.start(":8080").join();
//    }

#pragma once

// Server & routing
#include "karics/http-server-config.hpp"  // IWYU pragma: export
#include "karics/http-server.hpp"         // IWYU pragma: export
#include "karics/router-service.hpp"      // IWYU pragma: export
#include "karics/router.hpp"              // IWYU pragma: export

// Services
#include "karics/http-service.hpp"     // IWYU pragma: export
#include "karics/service-context.hpp"  // IWYU pragma: export

// Request / response
#include "karics/http-constants.hpp"    // IWYU pragma: export
#include "karics/http-method.hpp"       // IWYU pragma: export
#include "karics/http-request.hpp"      // IWYU pragma: export
#include "karics/http-response.hpp"     // IWYU pragma: export
#include "karics/http-status-code.hpp"  // IWYU pragma: export
#include "karics/http-version.hpp"      // IWYU pragma: export

// Coroutines & process helpers
#include "karics/signal-handler.hpp"  // IWYU pragma: export
#include "karics/task.hpp"            // IWYU pragma: export
#include "karics/worker.hpp"          // IWYU pragma: export
