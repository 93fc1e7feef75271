#include "karics/router-service.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include "karics/http-constants.hpp"
#include "karics/http-method.hpp"
#include "karics/http-request.hpp"
#include "karics/http-response.hpp"
#include "karics/http-status-code.hpp"
#include "karics/log.hpp"
#include "karics/router.hpp"

namespace karics {

HttpResponse NotFoundResponse() { return HttpResponse::Json(http::StatusCodeNotFound, http::kNotFoundJsonBody); }

HttpResponse MethodNotAllowedResponse(http::MethodBmp allowed) {
  HttpResponse response = HttpResponse::Json(http::StatusCodeMethodNotAllowed, http::kMethodNotAllowedJsonBody);
  response.header(http::Allow, http::MethodBmpToStr(allowed));
  return response;
}

RouterService::RouterService(std::shared_ptr<const Router> router, ServiceContext context,
                             bool answerMethodNotAllowed) noexcept
    : _router(std::move(router)), _context(std::move(context)), _answerMethodNotAllowed(answerMethodNotAllowed) {}

HttpResponse RouterService::call(const HttpRequest& request) {
  RouteResult result = _router->handle(request);
  if (result) {
    return std::move(*result);
  }
  if (result.error() == RouteMiss::MethodNotAllowed && _answerMethodNotAllowed) {
    return MethodNotAllowedResponse(_router->allowedMethods(request.path()));
  }
  log::debug("No route for {} {}", request.methodStr(), request.path());
  return NotFoundResponse();
}

RouterServiceFactory::RouterServiceFactory(std::shared_ptr<const Router> router, ServiceContext context)
    : _router(std::move(router)), _context(std::move(context)) {
  if (!_router) {
    throw std::invalid_argument("RouterServiceFactory requires a router");
  }
}

RouterServiceFactory::RouterServiceFactory(Router router, ServiceContext context)
    : RouterServiceFactory(std::make_shared<const Router>(std::move(router)), std::move(context)) {}

std::unique_ptr<HttpService> RouterServiceFactory::newService([[maybe_unused]] ConnectionId connectionId) const {
  return std::make_unique<RouterService>(_router, _context, _answerMethodNotAllowed);
}

}  // namespace karics
