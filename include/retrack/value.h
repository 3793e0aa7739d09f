#pragma once

#include <retrack/containers.h>

#include <fmt/format.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace retrack {

class runtime_t;
class object_t;
class property_ref;
struct value_t;

struct undefined_t {
  friend bool operator==(const undefined_t &, const undefined_t &) = default;
};

inline constexpr auto undefined = undefined_t{};

using null_t = std::nullptr_t;
using object_ptr = std::shared_ptr<object_t>;

/// Observation wrapper around a raw object.
/// Reads are tracked against the currently active effect,
/// writes trigger every effect that read the written key.
class observed_t {
  runtime_t *runtime_ = nullptr;
  object_ptr target_;

public:
  observed_t() = default;
  observed_t(runtime_t &runtime, object_ptr target);

  auto get(std::string_view key) const -> value_t;
  void set(std::string_view key, value_t value) const;
  auto operator[](std::string_view key) const -> property_ref;

  auto &raw() const { return target_; }
  auto runtime() const -> runtime_t &;

  explicit operator bool() const { return target_ != nullptr; }

  friend bool operator==(const observed_t &lhs, const observed_t &rhs) {
    return lhs.target_ == rhs.target_;
  }
};

using value_variant_t = std::variant<undefined_t, null_t, bool, std::int64_t,
                                     double, std::string, object_ptr,
                                     observed_t>;

struct value_t : value_variant_t {
  using value_variant_t::value_variant_t;

  value_t() = default;

  template <typename T> auto is() const {
    return std::holds_alternative<T>(*this);
  }

  template <typename T> auto &as() const { return std::get<T>(*this); }
};

inline auto is_object(const value_t &value) {
  if (auto object = std::get_if<object_ptr>(&value))
    return *object != nullptr;

  if (auto observed = std::get_if<observed_t>(&value))
    return bool{*observed};

  return false;
}

/// A keyed record. Keys keep their insertion order.
class object_t {
  insertion_order_map<std::string, value_t, std::less<>> props;

public:
  object_t() = default;
  object_t(std::initializer_list<std::pair<std::string, value_t>> init) {
    for (auto &[key, value] : init)
      props[key] = value;
  }

  // Missing keys read as undefined.
  auto get(std::string_view key) const -> value_t {
    if (auto value = props.find(key))
      return *value;

    return undefined;
  }

  void set(std::string_view key, value_t value) {
    props[key] = std::move(value);
  }

  auto contains(std::string_view key) const { return props.contains(key); }
  auto erase(std::string_view key) { return props.erase(key); }
  auto size() const { return props.size(); }
  auto begin() const { return props.begin(); }
  auto end() const { return props.end(); }

  auto keys() const {
    auto result = std::vector<std::string>{};
    for (auto &[key, _] : props)
      result.push_back(key);

    return result;
  }
};

inline auto make_object(
    std::initializer_list<std::pair<std::string, value_t>> init = {}) {
  return std::make_shared<object_t>(init);
}

inline auto to_string(const value_t &value) -> std::string {
  if (value.is<undefined_t>())
    return "undefined";
  if (value.is<null_t>())
    return "null";
  if (auto b = std::get_if<bool>(&value))
    return *b ? "true" : "false";
  if (auto i = std::get_if<std::int64_t>(&value))
    return fmt::format("{}", *i);
  if (auto d = std::get_if<double>(&value))
    return fmt::format("{}", *d);
  if (auto s = std::get_if<std::string>(&value))
    return *s;
  if (value.is<object_ptr>())
    return fmt::format("object({})", fmt::ptr(value.as<object_ptr>().get()));

  return fmt::format("observed({})",
                     fmt::ptr(value.as<observed_t>().raw().get()));
}

inline auto &operator<<(std::ostream &os, const value_t &value) {
  return os << to_string(value);
}

} // namespace retrack

template <> struct fmt::formatter<retrack::value_t> {
  constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const retrack::value_t &value, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", retrack::to_string(value));
  }
};
