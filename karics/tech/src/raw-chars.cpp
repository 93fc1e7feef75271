#include "karics/raw-chars.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <new>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace karics {

RawChars::RawChars(size_type capacity) { reserve(capacity); }

RawChars::RawChars(std::string_view data) { append(data); }

RawChars::RawChars(const RawChars& rhs) {
  if (!rhs.empty()) {
    append(rhs.data(), rhs.size());
  }
}

RawChars::RawChars(RawChars&& rhs) noexcept
    : _buf(std::exchange(rhs._buf, nullptr)),
      _size(std::exchange(rhs._size, 0)),
      _capacity(std::exchange(rhs._capacity, 0)) {}

RawChars& RawChars::operator=(const RawChars& rhs) {
  if (this != &rhs) [[likely]] {
    assign(rhs);
  }
  return *this;
}

RawChars& RawChars::operator=(RawChars&& rhs) noexcept {
  if (this != &rhs) [[likely]] {
    std::free(_buf);
    _buf = std::exchange(rhs._buf, nullptr);
    _size = std::exchange(rhs._size, 0);
    _capacity = std::exchange(rhs._capacity, 0);
  }
  return *this;
}

RawChars::~RawChars() { std::free(_buf); }

void RawChars::append(const_pointer data, size_type sz) {
  if (sz == 0) {
    return;
  }
  ensureAvailableCapacityExponential(sz);
  std::memcpy(_buf + _size, data, sz);
  _size += sz;
}

void RawChars::push_back(char ch) {
  ensureAvailableCapacityExponential(1);
  _buf[_size++] = ch;
}

void RawChars::assign(std::string_view data) {
  _size = 0;
  append(data);
}

void RawChars::erase_front(size_type n) {
  if (n >= _size) {
    _size = 0;
    return;
  }
  std::memmove(_buf, _buf + n, _size - n);
  _size -= n;
}

void RawChars::setSize(size_type newSize) {
  if (newSize > _capacity) [[unlikely]] {
    throw std::out_of_range("RawChars::setSize beyond capacity");
  }
  _size = newSize;
}

void RawChars::reserve(size_type newCapacity) {
  if (newCapacity > _capacity) {
    reallocUp(newCapacity);
  }
}

void RawChars::ensureAvailableCapacityExponential(size_type availableCapacity) {
  const size_type required = _size + availableCapacity;
  if (required > _capacity) {
    reallocUp(std::max(required, _capacity * 2U));
  }
}

void RawChars::shrinkIfEmpty(size_type maxCapacity) noexcept {
  if (_size == 0 && _capacity > maxCapacity) {
    std::free(std::exchange(_buf, nullptr));
    _capacity = 0;
  }
}

void RawChars::swap(RawChars& rhs) noexcept {
  using std::swap;
  swap(_buf, rhs._buf);
  swap(_size, rhs._size);
  swap(_capacity, rhs._capacity);
}

void RawChars::reallocUp(size_type newCapacity) {
  auto* newBuf = static_cast<pointer>(std::realloc(_buf, newCapacity));
  if (newBuf == nullptr) [[unlikely]] {
    throw std::bad_alloc();
  }
  _buf = newBuf;
  _capacity = newCapacity;
}

}  // namespace karics
