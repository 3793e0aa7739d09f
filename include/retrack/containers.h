#pragma once

#include <algorithm>
#include <functional>
#include <utility>
#include <vector>

#define RETRACK_FWD(x) std::forward<decltype(x)>(x)

namespace retrack {

template <typename Key, typename Value, typename Comparator = std::less<Key>>
class insertion_order_map {
  std::vector<std::pair<Key, Value>> nodes;

  static auto equivalent(const Key &lhs, const auto &rhs) {
    auto cmp = Comparator{};
    return not cmp(lhs, rhs) and not cmp(rhs, lhs);
  }

  // self is the map itself, const or not.
  static auto find_node(auto &&self, const auto &key) {
    return std::ranges::find_if(
        RETRACK_FWD(self).nodes, [&](auto &k) { return equivalent(k, key); },
        &std::pair<Key, Value>::first);
  }

public:
  auto size() const { return nodes.size(); }
  auto empty() const { return nodes.empty(); }
  auto begin() { return nodes.begin(); }
  auto end() { return nodes.end(); }
  auto begin() const { return nodes.begin(); }
  auto end() const { return nodes.end(); }

  auto &operator[](const auto &key) {
    auto it = find_node(*this, key);
    if (it != nodes.end()) {
      return it->second;
    }

    return nodes.emplace_back(key, Value{}).second;
  }

  auto contains(const auto &key) const {
    return find_node(*this, key) != nodes.end();
  }

  /// Returns a pointer to the mapped value, or nullptr if the key is absent.
  auto find(const auto &key) -> Value * {
    auto it = find_node(*this, key);
    return it != nodes.end() ? &it->second : nullptr;
  }

  auto find(const auto &key) const -> const Value * {
    auto it = find_node(*this, key);
    return it != nodes.end() ? &it->second : nullptr;
  }

  auto erase(const auto &key) -> bool {
    auto it = find_node(*this, key);
    if (it == nodes.end())
      return false;

    nodes.erase(it);
    return true;
  }

  template <typename Predicate> auto erase_if(Predicate pred) {
    return std::erase_if(nodes, [&](auto &node) { return pred(node); });
  }
};

template <typename T, typename Comparator = std::less<T>>
struct insertion_order_set {
  std::vector<T> nodes;

  auto size() const { return nodes.size(); }
  auto empty() const { return nodes.empty(); }
  auto begin() const { return nodes.begin(); }
  auto end() const { return nodes.end(); }
  auto contains(const T &value) const {
    return std::ranges::find_if(nodes, [&](auto &k) {
             auto cmp = Comparator{};
             return not cmp(k, value) and not cmp(value, k);
           }) != nodes.end();
  }
  auto insert(const T &value) {
    if (contains(value))
      return false;

    nodes.push_back(value);
    return true;
  }
  auto erase(const T &value) {
    return std::erase_if(nodes, [&](auto &k) {
      auto cmp = Comparator{};
      return not cmp(k, value) and not cmp(value, k);
    });
  }
  template <typename Predicate> auto erase_if(Predicate pred) {
    return std::erase_if(nodes, pred);
  }
  void clear() { nodes.clear(); }
};

template <typename F> struct scope_guard {
  F f;
  ~scope_guard() { f(); };
};

template <typename F> scope_guard(F) -> scope_guard<F>;

} // namespace retrack
