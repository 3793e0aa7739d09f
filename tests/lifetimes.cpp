#include "common.h"

#include <functional>
#include <memory>

class lifetime_tracker {
  std::weak_ptr<int> p;

public:
  auto alive() const { return !p.expired(); }

  auto track() {
    auto sp = std::make_shared<int>();
    p = sp;
    return sp;
  }
};

static suite<"lifetimes"> _ = [] {
  "scope"_test = [] {
    auto rt = runtime_t{};
    auto obj = reactive(rt, {{"foo", 1}});

    auto x = false;
    auto y = false;

    {
      effect(rt, [=, &x] {
        obj.get("foo");
        x = true;
      });
      watch(rt, obj, [&] { y = true; });
    }

    expect(rt.retained() == 2_u)
        << "the runtime should own effects and watches";

    x = false;
    y = false;
    obj.set("foo", 2);
    expect(x) << "effect should be kept alive by the runtime";
    expect(y) << "watch should be kept alive by the runtime";
  };

  "stop"_test = [] {
    auto rt = runtime_t{};
    auto obj = reactive(rt, {{"foo", 1}});

    auto runs = 0;
    auto e = effect(rt, [&] {
      obj.get("foo");
      ++runs;
    });

    e.stop();
    expect(not e.active());
    expect(e.deps().empty())
        << "a stopped effect should drop its subscriptions";
    expect(rt.retained() == 0_u) << "a stopped effect should be released";
    expect(rt.subscribers(obj.raw(), "foo") == 0_u);

    obj.set("foo", 2);
    expect(runs == 1_i) << "a stopped effect should not rerun";

    expect(throws<retrack::error>([&] { e(); }))
        << "running a stopped effect explicitly is an error";

    e.stop();
    expect(not e.active()) << "stopping twice should be harmless";
  };

  "stop_from_scheduler"_test = [] {
    auto rt = runtime_t{};
    auto obj = reactive(rt, {{"foo", 1}});

    auto runs = 0;
    auto scheduled = 0;
    effect(
        rt,
        [&] {
          obj.get("foo");
          ++runs;
        },
        {.scheduler = [&](retrack::effect_base_t &handle) {
          ++scheduled;
          rt.stop(handle);
        }});

    obj.set("foo", 2);
    obj.set("foo", 3);
    expect(scheduled == 1_i) << "the effect stopped itself the first time";
    expect(runs == 1_i);
    expect(rt.retained() == 0_u);
  };

  "stop_during_trigger"_test = [] {
    auto rt = runtime_t{};
    auto obj = reactive(rt, {{"foo", 1}});

    auto a = 0;
    auto b = 0;
    auto stop_b = std::function<void()>{};

    effect(rt, [&] {
      obj.get("foo");
      ++a;
      if (stop_b)
        stop_b();
    });
    auto e = effect(rt, [&] {
      obj.get("foo");
      ++b;
    });
    stop_b = [e] { e.stop(); };

    obj.set("foo", 2);
    expect(a == 2_i);
    expect(b == 1_i)
        << "an effect stopped earlier in the same trigger should not run";
  };

  "weak_targets"_test = [] {
    auto rt = runtime_t{};
    auto target = std::weak_ptr<retrack::object_t>{};

    {
      auto obj = reactive(rt, {{"foo", 1}});
      target = obj.raw();

      auto e = effect(rt, [&] { obj.get("foo"); });
      e.stop();
    }

    expect(target.expired())
        << "the dependency store should not keep targets alive";
    expect(rt.tracked_targets() == 1_u);

    expect(rt.prune() == 1_u);
    expect(rt.tracked_targets() == 0_u);
  };

  "prune"_test = [] {
    auto rt = runtime_t{};
    auto a = reactive(rt, {{"foo", 1}});
    auto b = reactive(rt, {{"foo", 1}, {"bar", 1}});

    effect(rt, [=] {
      a.get("foo");
      b.get("foo");
    });
    auto e = effect(rt, [=] { b.get("bar"); });

    expect(rt.prune() == 0_u) << "live subscriptions should be kept";
    expect(rt.tracked_targets() == 2_u);

    e.stop();
    expect(rt.prune() == 0_u) << "b is still observed through foo";
    expect(rt.subscribers(b.raw(), "bar") == 0_u);
    expect(rt.subscribers(b.raw(), "foo") == 1_u);
  };

  "computed_lifetime"_test = [] {
    auto rt = runtime_t{};
    auto obj = reactive(rt, {{"foo", 1}});
    auto c_lt = lifetime_tracker{};

    {
      auto c = computed(rt, [=, x = c_lt.track()] {
        return as_int(obj.get("foo"));
      });
      expect(c.value() == 1);
      expect(c_lt.alive()) << "c should be alive";
    }

    expect(not c_lt.alive()) << "c should be destroyed with its last handle";
    expect(rt.subscribers(obj.raw(), "foo") == 0_u)
        << "a destroyed computed should not be a live subscriber";

    obj.set("foo", 2);
    expect(rt.prune() == 1_u);
  };
};
