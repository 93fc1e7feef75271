#pragma once

#include <memory>

#include "karics/http-method.hpp"
#include "karics/http-request.hpp"
#include "karics/http-response.hpp"
#include "karics/http-service.hpp"
#include "karics/router.hpp"
#include "karics/service-context.hpp"

namespace karics {

// 404 response with a JSON error body, answered when no route matches.
HttpResponse NotFoundResponse();

// 405 response with a JSON error body and an Allow header listing 'allowed'.
HttpResponse MethodNotAllowedResponse(http::MethodBmp allowed);

// Service delegating to a shared immutable Router.
// Route misses are answered with NotFoundResponse(), or with MethodNotAllowedResponse() when the path matches
// routes of other methods and 405 answers are enabled.
class RouterService : public HttpService {
 public:
  explicit RouterService(std::shared_ptr<const Router> router, ServiceContext context = {},
                         bool answerMethodNotAllowed = false) noexcept;

  HttpResponse call(const HttpRequest& request) override;

  [[nodiscard]] const Router& router() const noexcept { return *_router; }

  // Shared context of the factory if it holds a T, nullptr otherwise.
  template <class T>
  [[nodiscard]] T* context() const noexcept {
    return _context.get<T>();
  }

 private:
  std::shared_ptr<const Router> _router;
  ServiceContext _context;
  bool _answerMethodNotAllowed;
};

class RouterServiceFactory : public HttpServiceFactory {
 public:
  explicit RouterServiceFactory(std::shared_ptr<const Router> router, ServiceContext context = {});

  explicit RouterServiceFactory(Router router, ServiceContext context = {});

  // Answer 405 with an Allow header instead of 404 when the path is only routed for other methods.
  RouterServiceFactory& withMethodNotAllowed(bool on = true) noexcept {
    _answerMethodNotAllowed = on;
    return *this;
  }

  [[nodiscard]] std::unique_ptr<HttpService> newService(ConnectionId connectionId) const override;

  [[nodiscard]] const std::shared_ptr<const Router>& router() const noexcept { return _router; }

 private:
  std::shared_ptr<const Router> _router;
  ServiceContext _context;
  bool _answerMethodNotAllowed{false};
};

}  // namespace karics
