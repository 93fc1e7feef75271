#pragma once

// Header-only spdlog, forced locally so consumers are free to link the compiled variant.
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace karics {
namespace log = spdlog;
}  // namespace karics
