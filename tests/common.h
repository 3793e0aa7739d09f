#pragma once

#include <retrack/retrack.h>

#include <boost/ut.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <tuple>
#include <vector>

using namespace boost::ut;
using namespace std::string_literals;

using retrack::computed;
using retrack::effect;
using retrack::effect_options_t;
using retrack::flush_t;
using retrack::make_object;
using retrack::observed_t;
using retrack::reactive;
using retrack::runtime_t;
using retrack::value_t;
using retrack::watch;
using retrack::watch_options_t;

auto to_vector(auto &&rng) {
  using T = std::ranges::range_value_t<decltype(rng)>;

  auto r = std::vector<T>{};
  for (auto &&x : rng)
    r.push_back(x);

  return r;
}

inline auto as_int(const value_t &value) { return value.as<std::int64_t>(); }

// Increments an integer property through the observation wrapper,
// i.e. a tracked read followed by a triggering write.
inline void increment(const observed_t &obj, std::string_view key) {
  obj.set(key, as_int(obj.get(key)) + 1);
}

#define CONCAT2(a, b) a##b
#define CONCAT(a, b) CONCAT2(a, b)
#define _ CONCAT(placeholder_, __LINE__)
