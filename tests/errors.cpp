#include "common.h"

#include <optional>

static suite<"errors"> _ = [] {
  "derived_failure"_test = [] {
    auto rt = runtime{silent()};
    auto a = rt.cell(1);

    auto runs = 0;
    auto b = rt.derived([=, &runs] {
      ++runs;
      if (a() < 0)
        throw std::domain_error{"negative"};
      return a() * 2;
    });
    expect(b() == 2_i);

    a.set(-1);
    expect(throws<std::domain_error>([&] { b(); }))
        << "the body's exception should reach the reader";
    expect(throws<std::domain_error>([&] { b(); }))
        << "a failure should not be cached";
    expect(runs == 3_i);

    a.set(3);
    expect(b() == 6_i) << "the cell should recover once its input is valid";
  };

  "effect_reading_failed_derived"_test = [] {
    auto rt = runtime{silent()};
    auto a = rt.cell(1);
    auto d = rt.derived([=] {
      if (a() == 2)
        throw std::runtime_error{"two"};
      return a();
    });

    auto runs = 0;
    auto last = 0;
    rt.effect([=, &runs, &last] {
      ++runs;
      last = d();
    });

    a.set(2);
    expect(runs == 2_i);
    expect(last == 1_i);

    a.set(3);
    expect(runs == 3_i) << "the effect should run again once the cell recovers";
    expect(last == 3_i);
  };

  "effect_catching_derived_failure"_test = [] {
    auto rt = runtime{silent()};
    auto a = rt.cell(1);
    auto d = rt.derived([=] {
      if (a() == 2)
        throw std::runtime_error{"two"};
      return a();
    });

    auto runs = 0;
    auto last = 0;
    rt.effect([=, &runs, &last] {
      ++runs;
      try {
        last = d();
      } catch (const std::runtime_error &) {
        last = -1;
      }
    });

    a.set(2);
    expect(runs == 2_i);
    expect(last == -1_i);

    a.set(3);
    expect(runs == 3_i) << "a failed read should still be a dependency";
    expect(last == 3_i);
  };

  "recovery_to_previous_value"_test = [] {
    auto rt = runtime{silent()};
    auto a = rt.cell(1);
    auto d = rt.derived([=] {
      if (a() == 2)
        throw std::runtime_error{"two"};
      return a();
    });

    auto last = 0;
    rt.effect([=, &last] {
      try {
        last = d();
      } catch (const std::runtime_error &) {
        last = -1;
      }
    });

    a.set(2);
    expect(last == -1_i);

    a.set(1);
    expect(last == 1_i)
        << "recovering to the value cached before the failure is a change";
  };

  "downstream_of_failed_derived"_test = [] {
    auto rt = runtime{silent()};
    auto a = rt.cell(1);
    auto d = rt.derived([=] {
      if (a() == 2)
        throw std::runtime_error{"two"};
      return a();
    });
    auto tens = rt.derived([=] { return d() * 10; });

    auto seen = std::vector<int>{};
    rt.effect([=, &seen] {
      try {
        seen.push_back(tens());
      } catch (const std::runtime_error &) {
        seen.push_back(-1);
      }
    });
    expect(tens() == 10_i);

    a.set(2);
    expect(throws<std::runtime_error>([&] { tens(); }))
        << "a failure should propagate through derived cells";
    expect(seen == std::vector{10, -1});

    a.set(3);
    expect(tens() == 30_i);
    expect(seen == std::vector{10, -1, 30})
        << "readers behind a derived cell should see the recovery";
  };

  "effect_failure"_test = [] {
    auto reported = std::vector<std::string>{};
    auto config = silent();
    config.on_error = [&reported](const ripple::recompute_error &err) {
      reported.push_back(ripple::describe(err.cause));
    };

    auto rt = runtime{config};
    auto a = rt.cell(0);

    rt.effect([=] {
      if (a() == 1)
        throw std::runtime_error{"boom"};
    });

    auto runs = 0;
    rt.effect([=, &runs] {
      a();
      ++runs;
    });

    expect(nothrow([&] { a.set(1); })) << "effect failures never reach writers";
    expect(reported == std::vector{"boom"s});
    expect(runs == 2_i) << "other effects should still run";
    expect(rt.stats().errors == 1u);

    a.set(2);
    expect(runs == 3_i);
    expect(reported.size() == 1u)
        << "a failed effect should keep its dependencies and recover";
  };

  "failing_cleanup"_test = [] {
    auto reported = 0;
    auto config = silent();
    config.on_error = [&reported](const ripple::recompute_error &) {
      ++reported;
    };

    auto rt = runtime{config};
    auto a = rt.cell(0);

    auto runs = 0;
    rt.effect([=, &runs] {
      a();
      ++runs;
      return [] { throw std::runtime_error{"cleanup"}; };
    });

    a.set(1);
    expect(reported == 1_i);
    expect(runs == 2_i) << "a throwing cleanup should not stop the next run";
  };

  "self_cycle"_test = [] {
    auto rt = runtime{silent()};

    auto self = std::optional<ripple::derived<int>>{};
    self.emplace(rt.derived([&] { return (*self)() + 1; }));

    expect(throws<ripple::cycle_error>([&] { (*self)(); }));
  };

  "mutual_cycle"_test = [] {
    auto rt = runtime{silent()};
    auto flip = rt.cell(false);

    auto a = std::optional<ripple::derived<int>>{};
    auto b = std::optional<ripple::derived<int>>{};
    a.emplace(rt.derived([&, flip] { return flip() ? (*b)() : 1; }));
    b.emplace(rt.derived([&] { return (*a)() + 1; }));

    expect(b->peek() == 2_i);

    flip.set(true);
    expect(throws<ripple::cycle_error>([&] { b->peek(); }));

    flip.set(false);
    expect(b->peek() == 2_i) << "breaking the cycle should recover the graph";
  };

  "runaway_flush"_test = [] {
    auto config = silent();
    config.max_flush_iterations = 10;

    auto rt = runtime{config};
    auto n = rt.cell(0);

    expect(throws<ripple::runaway_flush_error>(
        [&] { rt.effect([=] { n.set(n() + 1); }); }));
    expect(n.peek() == 11_i);

    auto m = rt.cell(0);
    auto seen = 0;
    rt.effect([=, &seen] { seen = m(); });
    m.set(3);
    expect(seen == 3_i) << "the runtime should stay usable after a runaway";
  };

  "disposed_read"_test = [] {
    auto rt = runtime{};
    auto a = rt.cell(1);

    auto inner = std::optional<ripple::derived<int>>{};
    auto dispose = rt.create_root([&](dispose_handle d) {
      inner.emplace(rt.derived([=] { return a() + 1; }));
      return d;
    });
    expect((*inner)() == 2_i);

    dispose();
    expect(throws<ripple::disposed_error>([&] { (*inner)(); }));
    expect(throws<ripple::disposed_error>([&] { inner->peek(); }));
  };

  "outlived_runtime"_test = [] {
    auto leftover = std::optional<ripple::derived<int>>{};
    auto value = std::optional<ripple::cell<int>>{};
    auto handle = dispose_handle{};
    {
      auto rt = runtime{};
      value.emplace(rt.cell(1));
      leftover.emplace(rt.derived([a = *value] { return a(); }));
      handle = rt.effect([] {});
    }

    expect(throws<ripple::disposed_error>([&] { (*leftover)(); }));
    expect(value->peek() == 1_i) << "cells keep their last value";
    expect(handle.disposed());
    expect(nothrow([&] { handle(); }));
  };

  "recompute_error"_test = [] {
    const auto err = ripple::recompute_error{
        "failed", std::make_exception_ptr(std::logic_error{"cause"})};

    expect(ripple::describe(err.cause) == "cause"s);
    expect(throws<std::logic_error>([&] { err.rethrow_cause(); }));
  };
};
