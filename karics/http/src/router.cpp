#include "karics/router.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "karics/http-method.hpp"
#include "karics/http-request.hpp"
#include "karics/http-response.hpp"
#include "karics/http-status-code.hpp"
#include "karics/log.hpp"

namespace karics {

namespace {

constexpr std::string_view kRegexMetaChars = "\\^$.|?*+()[]{}";

bool IsLiteralPattern(std::string_view pattern) {
  return pattern.find_first_of(kRegexMetaChars) == std::string_view::npos;
}

void ExtractCaptures(const std::cmatch& match, RouteParams& params) {
  params.clear();
  for (std::size_t groupIdx = 1; groupIdx < match.size(); ++groupIdx) {
    // Unmatched optional groups are passed as empty strings to keep the group order.
    params.push_back(match[groupIdx].matched ? match[groupIdx].str() : std::string{});
  }
}

}  // namespace

RouteError::RouteError(std::string_view pattern, std::string_view reason)
    : std::invalid_argument(fmt::format("invalid route pattern '{}': {}", pattern, reason)), _pattern(pattern) {}

bool Router::Route::matches(std::string_view path, RouteParams& params) const {
  if (std::holds_alternative<std::monostate>(compiled)) {
    params.clear();
    switch (matchType) {
      case MatchType::Exact:
        return path == pattern;
      case MatchType::Prefix:
        return path.starts_with(pattern);
      default:
        return path.contains(pattern);
    }
  }

  const std::regex& regex = std::get<std::regex>(compiled);
  std::cmatch match;
  const char* first = path.data();
  const char* last = path.data() + path.size();
  bool found;
  switch (matchType) {
    case MatchType::Exact:
      found = std::regex_match(first, last, match, regex);
      break;
    case MatchType::Prefix:
      found = std::regex_search(first, last, match, regex, std::regex_constants::match_continuous);
      break;
    default:
      found = std::regex_search(first, last, match, regex);
      break;
  }
  if (found) {
    ExtractCaptures(match, params);
  }
  return found;
}

Router& Router::route(http::MethodBmp methods, std::string_view pattern, RouteHandler handler,
                      MatchType matchType) {
  return addRoute(methods, pattern, matchType, std::move(handler));
}

Router& Router::route(http::MethodBmp methods, std::string_view pattern, RequestRouteHandler handler,
                      MatchType matchType) {
  return addRoute(methods, pattern, matchType, std::move(handler));
}

Router& Router::getWithStatus(std::string_view pattern, http::StatusCode status, std::string_view body) {
  return route(http::Method::GET, pattern,
               RouteHandler([status, body = std::string(body)](const RouteParams&) {
                 return HttpResponse(status).body(body);
               }));
}

Router& Router::addRoute(http::MethodBmp methods, std::string_view pattern, MatchType matchType,
                         std::variant<RouteHandler, RequestRouteHandler> handler) {
  if (pattern.empty()) {
    throw RouteError(pattern, "empty pattern");
  }
  if ((methods & http::kAllMethods) == 0) {
    throw RouteError(pattern, "no method");
  }
  const bool hasHandler = std::visit([](const auto& func) { return static_cast<bool>(func); }, handler);
  if (!hasHandler) {
    throw RouteError(pattern, "empty handler");
  }

  Route newRoute{methods, matchType, std::string(pattern), std::monostate{}, std::move(handler)};
  if (!IsLiteralPattern(pattern)) {
    try {
      newRoute.compiled = std::regex(newRoute.pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& ex) {
      throw RouteError(pattern, ex.what());
    }
  }

  const auto shadowingIt = std::ranges::find_if(_routes, [&newRoute](const Route& existing) {
    return (existing.methods & newRoute.methods) != 0 && existing.matchType == newRoute.matchType &&
           existing.pattern == newRoute.pattern;
  });
  if (shadowingIt != _routes.end()) {
    log::warn("Route '{}' for methods [{}] is shadowed by an earlier registration", pattern,
              http::MethodBmpToStr(methods & shadowingIt->methods));
  }

  _routes.push_back(std::move(newRoute));
  return *this;
}

RouteResult Router::handle(http::Method method, std::string_view path) const {
  static const HttpRequest kEmptyRequest;
  return dispatch(method, path, kEmptyRequest);
}

RouteResult Router::handle(const HttpRequest& request) const {
  return dispatch(request.method(), request.path(), request);
}

RouteResult Router::dispatch(http::Method method, std::string_view path, const HttpRequest& request) const {
  RouteParams params;
  for (const Route& route : _routes) {
    if (http::IsMethodSet(route.methods, method) && route.matches(path, params)) {
      if (const auto* paramsHandler = std::get_if<RouteHandler>(&route.handler)) {
        return (*paramsHandler)(params);
      }
      return std::get<RequestRouteHandler>(route.handler)(request, params);
    }
  }

  // Tell 404 from 405 by looking for the path among the routes of the other methods.
  const bool pathMatched = std::ranges::any_of(_routes, [method, path, &params](const Route& route) {
    return !http::IsMethodSet(route.methods, method) && route.matches(path, params);
  });
  return std::unexpected(pathMatched ? RouteMiss::MethodNotAllowed : RouteMiss::NotFound);
}

http::MethodBmp Router::allowedMethods(std::string_view path) const {
  http::MethodBmp methods = 0;
  RouteParams params;
  for (const Route& route : _routes) {
    if ((methods & route.methods) != route.methods && route.matches(path, params)) {
      methods |= route.methods;
    }
  }
  return methods;
}

}  // namespace karics
