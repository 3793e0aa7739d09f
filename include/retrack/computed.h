#pragma once

#include <retrack/effect.h>
#include <retrack/reactive.h>
#include <retrack/runtime.h>

#include <concepts>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace retrack {

template <typename F>
class computed_state : public std::enable_shared_from_this<computed_state<F>> {
public:
  using T = std::remove_cvref_t<std::invoke_result_t<F &>>;

  runtime_t *runtime;
  std::shared_ptr<effect_state<F>> effect;
  std::optional<T> value;
  bool dirty = true;

  explicit computed_state(runtime_t &runtime) : runtime{&runtime} {}

  auto &get() {
    if (dirty) {
      value = effect->run();
      dirty = false;
    }

    // The getter's own tracking belongs to the inner effect, so the computed
    // registers itself as an ordinary (target, "value") pair for the outer one.
    runtime->track(this->weak_from_this(), "value");
    return *value;
  }

  // Called by the inner effect's scheduler whenever a dependency changed.
  void invalidate() {
    dirty = true;
    runtime->event("computed(effect#{}) invalidated", effect->id);
    runtime->trigger(this->weak_from_this(), "value");
  }
};

template <typename F> class computed_ref {
public:
  using T = typename computed_state<F>::T;

  std::shared_ptr<computed_state<F>> state;

  explicit computed_ref(std::shared_ptr<computed_state<F>> state)
      : state{std::move(state)} {}

  /// Returns the cached value, recalculating it first if it is dirty.
  const T &value() const { return state->get(); }

  operator const T &() const { return value(); }
};

/// A lazily evaluated, cached value derived from getter.
template <std::invocable F> auto computed(runtime_t &runtime, F getter) {
  auto read = detail::read_through(std::move(getter));
  using read_t = decltype(read);

  auto state = std::make_shared<computed_state<read_t>>(runtime);

  auto scheduler = [weak = std::weak_ptr{state}](effect_base_t &) {
    if (auto self = weak.lock())
      self->invalidate();
  };

  state->effect = detail::make_effect(
      runtime, std::move(read),
      effect_options_t{.lazy = true, .scheduler = std::move(scheduler)});

  return computed_ref<read_t>{std::move(state)};
}

} // namespace retrack
