#include "common.h"

static suite<"mutations"> _ = [] {
  "mutation"_test = [] {
    auto rt = runtime_t{};
    auto target = make_object({{"foo", 1}});
    auto obj = reactive(rt, target);

    obj.set("foo", 2); // direct mutation via set
    expect(target->get("foo") == value_t{2})
        << "writes should be stored in the wrapped object";

    obj["foo"] = 3; // direct mutation via assignment
    expect(target->get("foo") == value_t{3});

    obj["bar"] = obj["foo"]; // copy one property into another
    expect(target->get("bar") == value_t{3});

    obj.set("foo", nullptr);
    expect(obj.get("foo").is<retrack::null_t>());

    expect(obj.get("missing").is<retrack::undefined_t>())
        << "missing keys should read as undefined";
  };

  "raw_writes_are_silent"_test = [] {
    auto rt = runtime_t{};
    auto target = make_object({{"foo", 1}});
    auto obj = reactive(rt, target);

    auto runs = 0;
    effect(rt, [&] {
      obj.get("foo");
      ++runs;
    });

    target->set("foo", 2);
    expect(runs == 1_i) << "writing the raw object should not trigger";

    obj.set("foo", 3);
    expect(runs == 2_i);
  };

  "property_ref"_test = [] {
    auto rt = runtime_t{};
    auto obj = reactive(rt, {{"foo", 1}});

    auto runs = 0;
    effect(rt, [&] {
      [[maybe_unused]] value_t foo = obj["foo"];
      ++runs;
    });

    obj["foo"] = 2;
    expect(runs == 2_i) << "assigning through operator[] should trigger";
    expect(obj["foo"] == value_t{2});
  };

  "nested_objects_are_not_wrapped"_test = [] {
    auto rt = runtime_t{};
    auto inner = make_object({{"bar", 1}});
    auto obj = reactive(rt, {{"inner", inner}});

    auto runs = 0;
    effect(rt, [&] {
      auto nested = obj.get("inner").as<retrack::object_ptr>();
      nested->get("bar");
      ++runs;
    });

    expect(obj.get("inner").is<retrack::object_ptr>())
        << "a nested object should be returned as stored";

    inner->set("bar", 2);
    expect(runs == 1_i) << "a raw nested object is not observed";

    obj.set("inner", make_object({{"bar", 3}}));
    expect(runs == 2_i);
  };

  "nested_observed_objects"_test = [] {
    auto rt = runtime_t{};
    auto inner = reactive(rt, {{"bar", 1}});
    auto obj = reactive(rt, {{"inner", inner}});

    auto runs = 0;
    effect(rt, [&] {
      obj.get("inner").as<observed_t>().get("bar");
      ++runs;
    });

    inner.set("bar", 2);
    expect(runs == 2_i)
        << "an observed object stored in a property stays observed";
  };

  "wrappers_share_the_target"_test = [] {
    auto rt = runtime_t{};
    auto target = make_object({{"foo", 1}});
    auto a = reactive(rt, target);
    auto b = reactive(rt, target);

    expect(a == b);

    auto runs = 0;
    effect(rt, [&] {
      a.get("foo");
      ++runs;
    });

    b.set("foo", 2);
    expect(runs == 2_i)
        << "subscriptions are keyed by the target, not by the wrapper";
  };
};
