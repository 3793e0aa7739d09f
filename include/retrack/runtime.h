#pragma once

#include <retrack/containers.h>
#include <retrack/error.h>
#include <retrack/log.h>

#include <cassert>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace retrack {

class runtime_t;
class effect_base_t;

using subscribers_t =
    insertion_order_set<std::weak_ptr<effect_base_t>, std::owner_less<>>;

/// The subscriber set of a single (target, key) pair.
struct dep_t {
  std::string key;
  subscribers_t subscribers;
};

using dep_ptr = std::shared_ptr<dep_t>;
using target_t = std::weak_ptr<const void>;
using scheduler_t = std::function<void(effect_base_t &)>;

struct effect_options_t {
  bool lazy = false;
  scheduler_t scheduler = {};
};

class effect_base_t : public std::enable_shared_from_this<effect_base_t> {
  runtime_t *runtime_;

public:
  const std::size_t id;
  effect_options_t options;

  // Every subscriber set this effect currently belongs to.
  std::vector<dep_ptr> deps;
  bool active = true;

  effect_base_t(runtime_t &runtime, effect_options_t options);
  virtual ~effect_base_t() = default;

  effect_base_t(const effect_base_t &) = delete;
  effect_base_t &operator=(const effect_base_t &) = delete;

  auto &runtime() const { return *runtime_; }

  // Runs the effect and discards its result.
  virtual void execute() = 0;

  void cleanup() {
    const auto self = weak_from_this();
    for (auto &dep : deps)
      dep->subscribers.erase(self);

    deps.clear();
  }
};

class runtime_t {
  using key_map_t = std::map<std::string, dep_ptr, std::less<>>;
  using bucket_t = std::map<target_t, key_map_t, std::owner_less<>>;

  logger_t logger_;
  bucket_t bucket_;
  std::vector<std::shared_ptr<effect_base_t>> effect_stack_;
  std::deque<std::function<void()>> jobs_;
  std::vector<std::shared_ptr<void>> scope_;
  std::size_t id_counter_ = 0;

public:
  explicit runtime_t(runtime_config_t config = {})
      : logger_{std::move(config)} {}

  runtime_t(const runtime_t &) = delete;
  runtime_t &operator=(const runtime_t &) = delete;

  auto &config() const { return logger_.config(); }
  void set_log_level(const log_level level) { logger_.set_level(level); }

  template <typename... Args>
  void log(const log_level level, fmt::format_string<Args...> format,
           Args &&...args) const {
    logger_.log(level, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void event(fmt::format_string<Args...> format, Args &&...args) const {
    logger_.log(log_level::trace, format, std::forward<Args>(args)...);
  }

  auto next_id() { return id_counter_++; }

  auto active_effect() const -> effect_base_t * {
    return effect_stack_.empty() ? nullptr : effect_stack_.back().get();
  }

  auto depth() const { return effect_stack_.size(); }

  /// Subscribes the active effect, if any, to the (target, key) pair.
  void track(const target_t &target, std::string_view key) {
    auto effect = active_effect();
    if (not effect or not effect->active)
      return;

    auto &dep = bucket_[target][std::string{key}];
    if (not dep)
      dep = std::make_shared<dep_t>(dep_t{std::string{key}, {}});

    if (dep->subscribers.insert(effect->weak_from_this()))
      effect->deps.push_back(dep);

    event("track(effect#{}, {})", effect->id, key);
  }

  /// Runs or schedules every effect subscribed to the (target, key) pair,
  /// except the effect that is currently running.
  void trigger(const target_t &target, std::string_view key) {
    auto target_it = bucket_.find(target);
    if (target_it == bucket_.end())
      return;

    auto dep_it = target_it->second.find(key);
    if (dep_it == target_it->second.end())
      return;

    const auto dep = dep_it->second;
    const auto current = active_effect();

    auto effects_to_run = std::vector<std::shared_ptr<effect_base_t>>{};
    for (auto &subscriber : dep->subscribers) {
      auto effect = subscriber.lock();
      if (not effect or not effect->active or effect.get() == current)
        continue;

      effects_to_run.push_back(std::move(effect));
    }

    event("trigger({}) -> {} effect(s)", key, effects_to_run.size());

    for (auto &effect : effects_to_run) {
      // An earlier effect in this round may have stopped it.
      if (not effect->active)
        continue;

      if (effect->options.scheduler) {
        event("schedule(effect#{})", effect->id);
        effect->options.scheduler(*effect);
      } else {
        effect->execute();
      }
    }
  }

  /// Executes f as the body of the given effect.
  /// Stale subscriptions are dropped first; the previous active effect is
  /// restored afterwards, also when f throws.
  template <typename F> decltype(auto) run(effect_base_t &effect, F &f) {
    if (not effect.active)
      throw error{"retrack: cannot run a stopped effect"};

    effect.cleanup();

    effect_stack_.push_back(effect.shared_from_this());
    auto pop = scope_guard{[this] {
      assert(not effect_stack_.empty());
      effect_stack_.pop_back();
    }};

    event("run(effect#{}) depth={}", effect.id, effect_stack_.size());
    return f();
  }

  /// Removes the effect from every subscriber set and releases it from the
  /// runtime scope. Stopping twice is a no-op.
  void stop(effect_base_t &effect) {
    if (not effect.active)
      return;

    const auto keep_alive = effect.shared_from_this();
    effect.active = false;
    effect.cleanup();
    release(keep_alive);

    log(log_level::debug, "stop(effect#{})", effect.id);
  }

  /// Keeps the given object alive for as long as the runtime exists,
  /// or until it is released.
  void retain(std::shared_ptr<void> p) { scope_.push_back(std::move(p)); }

  void release(const std::shared_ptr<const void> &p) {
    std::erase_if(scope_, [&](auto &q) {
      return not q.owner_before(p) and not p.owner_before(q);
    });
  }

  auto retained() const { return scope_.size(); }

  void enqueue(std::function<void()> job) {
    jobs_.push_back(std::move(job));
    event("enqueue() pending={}", jobs_.size());
  }

  auto pending_jobs() const { return jobs_.size(); }

  /// Runs every deferred job in FIFO order, including jobs queued while
  /// draining. Returns the number of jobs that ran.
  auto drain() {
    auto count = std::size_t{0};
    while (not jobs_.empty()) {
      auto job = std::move(jobs_.front());
      jobs_.pop_front();

      ++count;
      job();
    }

    if (count != 0)
      event("drain() ran {} job(s)", count);

    return count;
  }

  /// Drops bookkeeping that can no longer fire:
  /// expired subscribers, empty subscriber sets and entries of targets that
  /// are gone or no longer observed. Returns the number of targets removed.
  auto prune() {
    for (auto &[target, keys] : bucket_) {
      for (auto &[key, dep] : keys)
        dep->subscribers.erase_if([](auto &s) { return s.expired(); });

      std::erase_if(keys, [](auto &entry) {
        return entry.second->subscribers.empty();
      });
    }

    const auto removed = std::erase_if(bucket_, [](auto &entry) {
      return entry.first.expired() or entry.second.empty();
    });

    log(log_level::debug, "prune() removed {} target(s), {} remaining",
        removed, bucket_.size());

    return removed;
  }

  auto tracked_targets() const { return bucket_.size(); }

  /// Number of live subscribers of the (target, key) pair.
  auto subscribers(const target_t &target, std::string_view key) const {
    auto count = std::size_t{0};

    auto target_it = bucket_.find(target);
    if (target_it == bucket_.end())
      return count;

    auto dep_it = target_it->second.find(key);
    if (dep_it == target_it->second.end())
      return count;

    for (auto &subscriber : dep_it->second->subscribers)
      if (auto effect = subscriber.lock(); effect and effect->active)
        ++count;

    return count;
  }
};

inline effect_base_t::effect_base_t(runtime_t &runtime,
                                    effect_options_t options)
    : runtime_{&runtime}, id{runtime.next_id()}, options{std::move(options)} {}

} // namespace retrack
