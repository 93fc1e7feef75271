#pragma once

#include <cstdint>
#include <string_view>

namespace karics {

// Growable malloc-backed char buffer used as connection read buffer and response wire buffer.
// Unlike std::string, growing the buffer does not zero-initialize the new bytes, so the socket
// can read straight into the spare capacity (ensureAvailableCapacityExponential + addSize).
class RawChars {
 public:
  using value_type = char;
  using size_type = uint64_t;
  using pointer = char*;
  using const_pointer = const char*;
  using iterator = char*;
  using const_iterator = const char*;

  RawChars() noexcept = default;

  explicit RawChars(size_type capacity);

  explicit RawChars(std::string_view data);

  RawChars(const RawChars& rhs);
  RawChars(RawChars&& rhs) noexcept;

  RawChars& operator=(const RawChars& rhs);
  RawChars& operator=(RawChars&& rhs) noexcept;

  ~RawChars();

  void append(const_pointer data, size_type sz);

  void append(std::string_view data) { append(data.data(), data.size()); }

  void push_back(char ch);

  void assign(std::string_view data);

  void clear() noexcept { _size = 0; }

  // Remove the first n bytes, shifting the remaining ones to the front.
  void erase_front(size_type n);

  void setSize(size_type newSize);

  void addSize(size_type delta) { setSize(_size + delta); }

  [[nodiscard]] size_type size() const noexcept { return _size; }

  [[nodiscard]] size_type capacity() const noexcept { return _capacity; }

  [[nodiscard]] size_type availableCapacity() const noexcept { return _capacity - _size; }

  void reserve(size_type newCapacity);

  // Ensure that at least availableCapacity bytes can be written after end() without reallocation.
  // Growth is exponential.
  void ensureAvailableCapacityExponential(size_type availableCapacity);

  // Release the memory once the buffer is empty and its capacity exceeds maxCapacity.
  void shrinkIfEmpty(size_type maxCapacity) noexcept;

  [[nodiscard]] pointer data() noexcept { return _buf; }
  [[nodiscard]] const_pointer data() const noexcept { return _buf; }

  [[nodiscard]] iterator begin() noexcept { return _buf; }
  [[nodiscard]] const_iterator begin() const noexcept { return _buf; }

  [[nodiscard]] iterator end() noexcept { return _buf + _size; }
  [[nodiscard]] const_iterator end() const noexcept { return _buf + _size; }

  [[nodiscard]] bool empty() const noexcept { return _size == 0; }

  void swap(RawChars& rhs) noexcept;

  char& operator[](size_type pos) { return _buf[pos]; }
  char operator[](size_type pos) const { return _buf[pos]; }

  operator std::string_view() const noexcept { return {_buf, static_cast<std::size_t>(_size)}; }

  bool operator==(const RawChars& rhs) const noexcept {
    return static_cast<std::string_view>(*this) == static_cast<std::string_view>(rhs);
  }

 private:
  void reallocUp(size_type newCapacity);

  pointer _buf = nullptr;
  size_type _size = 0;
  size_type _capacity = 0;
};

inline void swap(RawChars& lhs, RawChars& rhs) noexcept { lhs.swap(rhs); }

}  // namespace karics
