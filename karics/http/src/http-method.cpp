#include "karics/http-method.hpp"

#include <string>

namespace karics::http {

std::string MethodBmpToStr(MethodBmp methodBmp) {
  std::string ret;
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (IsMethodSet(methodBmp, MethodFromIdx(methodIdx))) {
      if (!ret.empty()) {
        ret.append(", ");
      }
      ret.append(kMethodStrings[methodIdx]);
    }
  }
  return ret;
}

}  // namespace karics::http
