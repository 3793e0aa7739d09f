#pragma once

#include <retrack/effect.h>
#include <retrack/runtime.h>
#include <retrack/traverse.h>

#include <concepts>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace retrack {

enum class flush_t {
  sync,
  post,
};

inline auto to_string(const flush_t flush) {
  switch (flush) {
  default:
    return "unknown";
  case flush_t::sync:
    return "sync";
  case flush_t::post:
    return "post";
  }
}

struct watch_options_t {
  bool immediate = false;
  flush_t flush = flush_t::sync;
};

struct watch_base_t : std::enable_shared_from_this<watch_base_t> {
  runtime_t *runtime;
  flush_t flush;
  bool active = true;

  watch_base_t(runtime_t &runtime, flush_t flush)
      : runtime{&runtime}, flush{flush} {}
  virtual ~watch_base_t() = default;

  virtual auto effect() -> effect_base_t & = 0;
  virtual void job() = 0;

  void schedule() {
    if (flush == flush_t::sync) {
      job();
      return;
    }

    // The job keeps the watcher alive until it has run.
    runtime->enqueue([self = shared_from_this()] { self->job(); });
  }

  void stop() {
    if (not active)
      return;

    const auto keep_alive = shared_from_this();
    active = false;
    runtime->stop(effect());
    runtime->release(keep_alive);
  }
};

template <typename Getter, typename Callback>
class watch_state : public watch_base_t {
public:
  using T = std::remove_cvref_t<std::invoke_result_t<Getter &>>;

  Callback callback;
  std::shared_ptr<effect_state<Getter>> getter_effect;
  std::optional<T> old_value;
  std::optional<T> new_value;

  watch_state(runtime_t &runtime, Callback callback, flush_t flush)
      : watch_base_t{runtime, flush}, callback{std::move(callback)} {}

  virtual auto effect() -> effect_base_t & override { return *getter_effect; }

  virtual void job() override {
    // A job queued before stop() still runs, but does nothing.
    if (not active)
      return;

    new_value = getter_effect->run();

    if constexpr (std::invocable<Callback &, const T &,
                                 const std::optional<T> &>) {
      callback(*new_value, old_value);
    } else {
      callback();
    }

    // Only now, so the callback still sees the previous value.
    old_value = new_value;
  }
};

class watch_handle {
  std::weak_ptr<watch_base_t> state;

public:
  explicit watch_handle(std::weak_ptr<watch_base_t> state)
      : state{std::move(state)} {}

  auto active() const {
    auto p = state.lock();
    return p and p->active;
  }

  void stop() const {
    if (auto p = state.lock())
      p->stop();
  }
};

namespace detail {

template <std::invocable Source> auto resolve_getter(Source source) {
  return read_through(std::move(source));
}

// Observing a whole object means subscribing to every reachable property.
inline auto resolve_getter(observed_t source) {
  return [source = std::move(source)] { return traverse(source); };
}

} // namespace detail

/// Calls callback(new_value, old_value) whenever what source reads changes.
/// source is either a getter or an observed object.
template <typename Source, typename Callback>
auto watch(runtime_t &runtime, Source source, Callback callback,
           watch_options_t options = {}) {
  auto getter = detail::resolve_getter(std::move(source));
  using state_t = watch_state<decltype(getter), Callback>;

  auto state =
      std::make_shared<state_t>(runtime, std::move(callback), options.flush);

  auto scheduler = [weak = std::weak_ptr{state}](effect_base_t &) {
    if (auto self = weak.lock())
      self->schedule();
  };

  state->getter_effect = detail::make_effect(
      runtime, std::move(getter),
      effect_options_t{.lazy = true, .scheduler = std::move(scheduler)});

  runtime.retain(state);
  runtime.log(log_level::debug, "watch(effect#{}) created (immediate={}, "
              "flush={})",
              state->getter_effect->id, options.immediate,
              to_string(options.flush));

  if (options.immediate)
    state->job();
  else
    state->old_value = state->getter_effect->run();

  return watch_handle{state};
}

} // namespace retrack
