#include <retrack/retrack.h>

#include <fmt/core.h>

#include <cstdint>
#include <optional>
#include <string_view>

using namespace retrack;

int main(int argc, char *argv[]) {
  auto rt = runtime_t{};
  if (argc > 1 and std::string_view{argv[1]} == "--trace")
    rt.set_log_level(log_level::trace);

  auto obj = reactive(rt, {{"foo", 1}, {"bar", 2}});

  watch(rt, obj, [] { fmt::print("obj changed\n"); }, {.immediate = true});
  // obj changed

  obj["foo"] = obj.get("foo").as<std::int64_t>() + 1;
  // obj changed

  watch(
      rt, [=] { return obj.get("foo"); },
      [](const value_t &new_value, const std::optional<value_t> &old_value) {
        fmt::print("foo changed: {} -> {}\n", old_value.value_or(undefined),
                   new_value);
      },
      {.flush = flush_t::post});

  obj["foo"] = 10;
  // obj changed

  fmt::print("end of turn\n");
  rt.drain();
  // foo changed: 2 -> 10

  auto doubled = computed(rt, [=] {
    fmt::print("calc doubled\n");
    return obj.get("foo").as<std::int64_t>() * 2;
  });

  effect(rt, [=] { fmt::print(">> {}\n", doubled.value()); });
  // calc doubled
  // >> 20

  obj.set("bar", 3);
  // obj changed

  // The object watch reran on bar, so it is now notified after doubled.
  obj.set("foo", 21);
  // calc doubled
  // >> 42
  // obj changed

  rt.drain();
  // foo changed: 10 -> 21
}
