#pragma once

#include <retrack/runtime.h>

#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>

namespace retrack {

template <typename F> class effect_state : public effect_base_t {
public:
  using result_t = std::invoke_result_t<F &>;

  F f;

  effect_state(runtime_t &runtime, F f, effect_options_t options)
      : effect_base_t{runtime, std::move(options)}, f{std::move(f)} {}

  decltype(auto) run() { return runtime().run(*this, f); }

  virtual void execute() override final { run(); }
};

namespace detail {

// Creates an effect that nothing but the caller keeps alive.
template <std::invocable F>
auto make_effect(runtime_t &runtime, F f, effect_options_t options) {
  return std::make_shared<effect_state<F>>(runtime, std::move(f),
                                           std::move(options));
}

} // namespace detail

template <typename F> class effect_handle {
public:
  std::shared_ptr<effect_state<F>> state;

  explicit effect_handle(std::shared_ptr<effect_state<F>> state)
      : state{std::move(state)} {}

  /// Forces an immediate rerun and returns the body's result.
  decltype(auto) operator()() const { return state->run(); }

  /// The subscriber sets this effect belongs to after its latest run.
  auto &deps() const { return state->deps; }
  auto &options() const { return state->options; }
  auto active() const { return state->active; }
  auto id() const { return state->id; }

  void stop() const { state->runtime().stop(*state); }
};

/// Registers f as an effect. The runtime keeps it alive until it is stopped.
/// Unless lazy, it runs once right away, through the same path as any rerun.
template <std::invocable F>
auto effect(runtime_t &runtime, F f, effect_options_t options = {}) {
  auto state = detail::make_effect(runtime, std::move(f), std::move(options));

  runtime.retain(state);
  runtime.log(log_level::debug, "effect#{} created (lazy={})", state->id,
              state->options.lazy);

  if (not state->options.lazy)
    state->run();

  return effect_handle<F>{std::move(state)};
}

} // namespace retrack
