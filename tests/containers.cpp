#include "common.h"

#include <tuple>

using ripple::insertion_order_map;
using ripple::insertion_order_set;
using ripple::slot_id;
using ripple::slot_map;

static suite<"containers"> _ = [] {
  auto x = std::make_shared<int>(42);
  auto y = std::make_shared<int>(1729);

  "insertion_order_map"_test =
      [](auto data) {
        auto [key0, key1, cmp] = data;
        using key_t = decltype(key0);
        using cmp_t = decltype(cmp);

        auto eq = [=](auto lhs, auto rhs) {
          return not cmp(lhs, rhs) and not cmp(rhs, lhs);
        };

        auto m = insertion_order_map<key_t, int, cmp_t>{};

        expect(m.size() == 0_i);
        expect(m.begin() == m.end());
        expect(not m.contains(key0));
        expect(that % m[key0] == 0);
        expect(m.size() == 1_i);
        expect(m.contains(key0));
        expect(that % (m[key0] = 42) == 42);
        expect(m.size() == 1_i) << "writing an existing key should not insert";

        expect(m.erase(key0));
        expect(not m.contains(key0));
        expect(m.size() == 0_i);

        expect(that % (m[key1] = 1729) == 1729);
        expect(that % (m[key0] = 42) == 42);
        expect(m.size() == 2_i);

        auto keys = to_vector(m | std::views::keys);
        expect(that % eq(keys[0], key1)) << "iteration follows insertion order";
        expect(that % eq(keys[1], key0));

        expect(m.erase(key1));
        expect(not m.erase(key1));
        expect(m.size() == 1_i);
      } |
      std::tuple{
          std::tuple{42, 1729, std::less{}},
          std::tuple{std::weak_ptr{x}, std::weak_ptr{y}, std::owner_less{}},
      };

  "insertion_order_set"_test = [] {
    auto s = insertion_order_set<int>{};

    expect(s.insert(3));
    expect(s.insert(1));
    expect(not s.insert(3)) << "duplicates should be rejected";
    expect(to_vector(s) == std::vector{3, 1});

    expect(s.erase(3));
    expect(not s.contains(3));
    expect(s.size() == 1_i);
  };

  "slot_map"_test = [] {
    struct tag;
    auto m = slot_map<tag, std::string>{};

    const auto a = m.insert("a");
    const auto b = m.insert("b");
    expect(m.size() == 2_i);
    expect(*m.get(a) == "a"s);
    expect(*m.get(b) == "b"s);

    auto *stable = m.get(a);
    for (auto i = 0; i < 100; ++i)
      m.insert(std::to_string(i));
    expect(m.get(a) == stable) << "growth should not move existing values";

    expect(m.erase(a));
    expect(not m.erase(a));
    expect(m.get(a) == nullptr);

    const auto c = m.insert("c");
    expect(c.index == a.index) << "released slots should be reused";
    expect(c.generation != a.generation);
    expect(not m.contains(a)) << "ids of released slots should not resolve";
    expect(*m.get(c) == "c"s);

    expect(not m.contains(slot_id<tag>{}));
    expect(m.get(slot_id<tag>{}) == nullptr);
  };

  "slot_map_for_each"_test = [] {
    struct tag;
    auto m = slot_map<tag, int>{};
    const auto a = m.insert(1);
    m.insert(2);
    m.insert(3);
    m.erase(a);

    auto total = 0;
    m.for_each([&](slot_id<tag>, int value) { total += value; });
    expect(total == 5_i) << "released slots should be skipped";
  };
};
