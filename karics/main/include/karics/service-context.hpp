#pragma once

#include <memory>
#include <typeinfo>
#include <utility>

namespace karics {

// Type-erased, shared, user owned state made available to the services of a factory.
// The state is shared by all connections of all workers: its own synchronization is the owner's business.
class ServiceContext {
 public:
  ServiceContext() noexcept = default;

  template <class T>
  explicit ServiceContext(std::shared_ptr<T> state) noexcept : _state(std::move(state)), _type(&typeid(T)) {}

  // Pointer to the state if it holds a T, nullptr otherwise.
  template <class T>
  [[nodiscard]] T* get() const noexcept {
    if (_type == nullptr || *_type != typeid(T)) {
      return nullptr;
    }
    return static_cast<T*>(_state.get());
  }

  [[nodiscard]] bool empty() const noexcept { return _state == nullptr; }

 private:
  std::shared_ptr<void> _state;
  const std::type_info* _type{nullptr};
};

}  // namespace karics
