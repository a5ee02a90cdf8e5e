#pragma once

#include <ripple/ripple.h>

#include <boost/ut.hpp>

#include <algorithm>
#include <memory>
#include <ranges>
#include <string>
#include <utility>
#include <vector>

using namespace boost::ut;
using namespace std::string_literals;

using ripple::dispose_handle;
using ripple::runtime;
using ripple::runtime_config;

auto to_vector(auto &&rng) {
  using T = std::ranges::range_value_t<decltype(rng)>;

  auto r = std::vector<T>{};
  for (auto &&x : rng)
    r.push_back(x);

  return r;
}

// Runtime configuration for tests that exercise failures on purpose.
inline auto silent() {
  auto config = runtime_config{};
  config.level = ripple::log_level::off;
  return config;
}

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
