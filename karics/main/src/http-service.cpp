#include "karics/http-service.hpp"

#include "karics/http-request.hpp"
#include "karics/http-response.hpp"
#include "karics/task.hpp"

namespace karics {

Task<HttpResponse> HttpService::callAsync(const HttpRequest& request) { co_return call(request); }

}  // namespace karics
