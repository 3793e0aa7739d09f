#pragma once

#include <retrack/error.h>
#include <retrack/runtime.h>
#include <retrack/value.h>

#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace retrack {

/// A single property of an observed object.
/// Converting it to a value reads (and tracks), assigning to it writes (and
/// triggers).
class property_ref {
  observed_t owner;
  std::string key;

public:
  property_ref(observed_t owner, std::string_view key)
      : owner{std::move(owner)}, key{key} {}

  auto get() const { return owner.get(key); }
  operator value_t() const { return get(); }

  auto &operator=(value_t value) {
    owner.set(key, std::move(value));
    return *this;
  }

  auto &operator=(const property_ref &other) { return *this = other.get(); }

  friend bool operator==(const property_ref &lhs, const value_t &rhs) {
    return lhs.get() == rhs;
  }
};

namespace detail {

template <typename T> struct read_result {
  using type = T;
};

// A property reference returned from a getter is read right away.
template <> struct read_result<property_ref> {
  using type = value_t;
};

template <typename F>
using read_result_t =
    typename read_result<std::remove_cvref_t<std::invoke_result_t<F &>>>::type;

// Wraps a getter such that its result is converted while the getter's effect
// is still active, so that a returned property_ref is tracked.
template <std::invocable F> auto read_through(F f) {
  return [f = std::move(f)]() mutable -> read_result_t<F> { return f(); };
}

} // namespace detail

inline observed_t::observed_t(runtime_t &runtime, object_ptr target)
    : runtime_{&runtime}, target_{std::move(target)} {
  if (not target_)
    throw error{"retrack: cannot observe a null object"};
}

inline auto observed_t::runtime() const -> runtime_t & {
  if (not runtime_)
    throw error{"retrack: empty observation wrapper"};

  return *runtime_;
}

inline auto observed_t::get(std::string_view key) const -> value_t {
  auto &rt = runtime();
  rt.track(target_, key);

  // Nested objects are returned as stored, without wrapping them.
  return target_->get(key);
}

inline void observed_t::set(std::string_view key, value_t value) const {
  auto &rt = runtime();
  rt.event("set({}, {})", key, value);

  target_->set(key, std::move(value));

  // Every write notifies, even when the value did not change.
  rt.trigger(target_, key);
}

inline auto observed_t::operator[](std::string_view key) const
    -> property_ref {
  return property_ref{*this, key};
}

/// Wraps target such that reads through the wrapper are tracked and writes
/// through the wrapper are triggered.
inline auto reactive(runtime_t &runtime, object_ptr target) {
  return observed_t{runtime, std::move(target)};
}

inline auto
reactive(runtime_t &runtime,
         std::initializer_list<std::pair<std::string, value_t>> init) {
  return observed_t{runtime, make_object(init)};
}

} // namespace retrack
