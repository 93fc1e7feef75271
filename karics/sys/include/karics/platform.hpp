#pragma once

#include <cerrno>

namespace karics {

// Native OS handle for sockets, epoll and eventfd descriptors.
using NativeHandle = int;

inline constexpr NativeHandle kInvalidHandle = -1;

inline int LastSystemError() noexcept { return errno; }

}  // namespace karics
