#include "common.h"

static suite<"subscriptions"> _ = [] {
  "cell"_test = [] {
    auto rt = runtime{};
    auto a = rt.cell(1);

    auto seen = std::vector<int>{};
    auto unsubscribe = ripple::subscribe(a, [&](int v) { seen.push_back(v); });
    expect(seen.empty()) << "the current value should not be reported";

    a.set(2);
    a.set(3);
    expect(seen == std::vector{2, 3});

    unsubscribe();
    a.set(4);
    expect(seen == std::vector{2, 3}) << "unsubscribing should stop callbacks";
  };

  "batched"_test = [] {
    auto rt = runtime{};
    auto a = rt.cell(1);

    auto seen = std::vector<int>{};
    ripple::subscribe(a, [&](int v) { seen.push_back(v); });

    rt.batch([&] {
      a.set(2);
      a.set(3);
    });
    expect(seen == std::vector{3});
  };

  "derived"_test = [] {
    auto rt = runtime{};
    auto a = rt.cell(1);
    auto tens = rt.derived([=] { return a() / 10; });

    auto seen = std::vector<int>{};
    ripple::subscribe(tens, [&](int v) { seen.push_back(v); });

    a.set(5);
    expect(seen.empty()) << "an unchanged derived value should not be reported";

    a.set(15);
    expect(seen == std::vector{1});
  };

  "untracked_callback"_test = [] {
    auto rt = runtime{};
    auto a = rt.cell(1);
    auto other = rt.cell(0);

    auto calls = 0;
    ripple::subscribe(a, [&, other](int) {
      other();
      ++calls;
    });

    a.set(2);
    other.set(1);
    expect(calls == 1_i) << "reads inside the callback should not subscribe";
  };
};
