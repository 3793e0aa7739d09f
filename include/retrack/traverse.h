#pragma once

#include <retrack/reactive.h>
#include <retrack/value.h>

#include <set>
#include <utility>
#include <vector>

namespace retrack {

/// Reads every property reachable from value, so that the active effect
/// subscribes to all of them. Reads through observed objects are tracked,
/// raw objects are walked without tracking. Each object is visited at most
/// once per call, which makes reference cycles terminate. An observed object
/// and its raw target are distinct visits.
inline auto &traverse(const value_t &value) {
  auto seen = std::set<std::pair<const object_t *, bool>>{};
  auto pending = std::vector<value_t>{};

  if (is_object(value))
    pending.push_back(value);

  while (not pending.empty()) {
    const auto current = std::move(pending.back());
    pending.pop_back();

    if (auto observed = std::get_if<observed_t>(&current)) {
      if (not seen.insert({observed->raw().get(), true}).second)
        continue;

      for (auto &key : observed->raw()->keys()) {
        auto property = observed->get(key);
        if (is_object(property))
          pending.push_back(std::move(property));
      }
    } else {
      auto &object = current.as<object_ptr>();
      if (not seen.insert({object.get(), false}).second)
        continue;

      for (auto &[key, property] : *object) {
        if (is_object(property))
          pending.push_back(property);
      }
    }
  }

  return value;
}

inline auto &traverse(const observed_t &observed) {
  traverse(value_t{observed});
  return observed;
}

} // namespace retrack
