#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "karics/http-method.hpp"
#include "karics/http-request.hpp"
#include "karics/http-response.hpp"
#include "karics/http-status-code.hpp"

namespace karics {

// Matched capture groups of a route pattern, in group order (the whole match is not included).
using RouteParams = std::vector<std::string>;

// Handler only interested in the captured parameters.
using RouteHandler = std::function<HttpResponse(const RouteParams&)>;

// Handler also needing the request (headers, body, query).
using RequestRouteHandler = std::function<HttpResponse(const HttpRequest&, const RouteParams&)>;

enum class MatchType : uint8_t {
  // The whole path must be equal to (literal pattern) or match (regex pattern) the pattern.
  Exact,
  // The path must start with the pattern (literal) or with a match of the pattern (regex).
  Prefix,
  // ECMAScript regex searched anywhere in the path, anchors are up to the caller.
  Regex
};

// Thrown at registration for invalid patterns (empty, or failing regex compilation).
class RouteError : public std::invalid_argument {
 public:
  RouteError(std::string_view pattern, std::string_view reason);

  [[nodiscard]] const std::string& pattern() const noexcept { return _pattern; }

 private:
  std::string _pattern;
};

enum class RouteMiss : uint8_t {
  // No route matches the path.
  NotFound,
  // Some route matches the path, but none for the request method.
  MethodNotAllowed
};

using RouteResult = std::expected<HttpResponse, RouteMiss>;

// Ordered (method, pattern, handler) table with first-match-wins dispatch.
//
// Routes are tried in registration order and the first one matching both method and path wins, even if a later
// one would match more precisely: registration order is part of the routing contract.
// Patterns are either literal strings (plain comparison) or regular expressions compiled once at registration.
//
// A Router is built before serving, then shared read-only (std::shared_ptr<const Router>) by all connections.
// handle() is const and safe to call concurrently; there is no mutation once serving started.
class Router {
 public:
  Router() noexcept = default;

  // Generic registration. Throws RouteError if the pattern is invalid.
  Router& route(http::MethodBmp methods, std::string_view pattern, RouteHandler handler,
                MatchType matchType = MatchType::Exact);

  Router& route(http::MethodBmp methods, std::string_view pattern, RequestRouteHandler handler,
                MatchType matchType = MatchType::Exact);

  Router& route(http::Method method, std::string_view pattern, RouteHandler handler,
                MatchType matchType = MatchType::Exact) {
    return route(static_cast<http::MethodBmp>(method), pattern, std::move(handler), matchType);
  }

  Router& route(http::Method method, std::string_view pattern, RequestRouteHandler handler,
                MatchType matchType = MatchType::Exact) {
    return route(static_cast<http::MethodBmp>(method), pattern, std::move(handler), matchType);
  }

  template <class Handler>
  Router& get(std::string_view pattern, Handler&& handler) {
    return route(http::Method::GET, pattern, std::forward<Handler>(handler));
  }

  template <class Handler>
  Router& post(std::string_view pattern, Handler&& handler) {
    return route(http::Method::POST, pattern, std::forward<Handler>(handler));
  }

  template <class Handler>
  Router& put(std::string_view pattern, Handler&& handler) {
    return route(http::Method::PUT, pattern, std::forward<Handler>(handler));
  }

  template <class Handler>
  Router& del(std::string_view pattern, Handler&& handler) {
    return route(http::Method::DELETE, pattern, std::forward<Handler>(handler));
  }

  template <class Handler>
  Router& patch(std::string_view pattern, Handler&& handler) {
    return route(http::Method::PATCH, pattern, std::forward<Handler>(handler));
  }

  template <class Handler>
  Router& head(std::string_view pattern, Handler&& handler) {
    return route(http::Method::HEAD, pattern, std::forward<Handler>(handler));
  }

  template <class Handler>
  Router& options(std::string_view pattern, Handler&& handler) {
    return route(http::Method::OPTIONS, pattern, std::forward<Handler>(handler));
  }

  // Same handler for all methods of the bitmap.
  template <class Handler>
  Router& any(http::MethodBmp methods, std::string_view pattern, Handler&& handler) {
    return route(methods, pattern, std::forward<Handler>(handler));
  }

  // GET route answering a fixed status and body.
  Router& getWithStatus(std::string_view pattern, http::StatusCode status, std::string_view body);

  // Dispatches (method, path) to the first matching route.
  // Request aware handlers receive an empty request.
  [[nodiscard]] RouteResult handle(http::Method method, std::string_view path) const;

  // Dispatches the request (by its method and path) to the first matching route.
  [[nodiscard]] RouteResult handle(const HttpRequest& request) const;

  // Methods of all routes whose pattern matches path.
  [[nodiscard]] http::MethodBmp allowedMethods(std::string_view path) const;

  [[nodiscard]] std::size_t size() const noexcept { return _routes.size(); }

  [[nodiscard]] bool empty() const noexcept { return _routes.empty(); }

 private:
  struct Route {
    [[nodiscard]] bool matches(std::string_view path, RouteParams& params) const;

    http::MethodBmp methods;
    MatchType matchType;
    std::string pattern;
    // Literal patterns are compared as strings, the others are compiled.
    std::variant<std::monostate, std::regex> compiled;
    std::variant<RouteHandler, RequestRouteHandler> handler;
  };

  Router& addRoute(http::MethodBmp methods, std::string_view pattern, MatchType matchType,
                   std::variant<RouteHandler, RequestRouteHandler> handler);

  RouteResult dispatch(http::Method method, std::string_view path, const HttpRequest& request) const;

  std::vector<Route> _routes;
};

}  // namespace karics
