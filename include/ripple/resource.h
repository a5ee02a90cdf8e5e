#pragma once

#include "cell.h"
#include "derived.h"
#include "engine.h"

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace ripple {

template <typename T> struct resource_state {
  std::function<T()> fetcher;
  cell<std::optional<T>> data;
  cell<bool> loading;
  cell<std::exception_ptr> error;
};

/// A value produced by a fetcher that may fail. The last good value, the
/// loading flag and the last failure are each held in a cell, so readers
/// react to every one of them. The fetcher runs synchronously, untracked: a
/// resource only fetches again through refresh().
template <typename T> class resource {
  std::shared_ptr<resource_state<T>> state;

public:
  using value_type = T;

  explicit resource(std::shared_ptr<resource_state<T>> state)
      : state{std::move(state)} {}

  /// The fetched value. Rethrows the failure of the latest fetch.
  const T &read() const {
    const auto &value = state->data();
    if (const auto &err = state->error())
      std::rethrow_exception(err);
    return *value;
  }

  const T &operator()() const { return read(); }

  auto loading() const { return state->loading(); }
  auto error() const { return state->error(); }

  /// Runs the fetcher again. Readers are notified once, when it returned.
  void refresh() const {
    auto e = state->data.owner().lock();
    if (not e)
      throw disposed_error{"runtime of resource was destroyed"};

    auto &s = *state;
    e->batch([&] {
      s.loading.set(true);
      s.error.set(std::exception_ptr{});

      try {
        s.data.set(std::optional<T>{e->untrack(s.fetcher)});
      } catch (...) {
        const auto err = std::current_exception();
        e->log().debug("resource fetch failed: {}", describe(err));
        s.error.set(err);
      }

      s.loading.set(false);
    });
  }
};

template <typename F> auto make_resource(const std::shared_ptr<engine> &e, F f) {
  using T = result_t<F>;
  auto state = std::make_shared<resource_state<T>>(resource_state<T>{
      std::function<T()>{std::move(f)},
      make_cell(e, std::optional<T>{}),
      make_cell(e, true),
      make_cell(e, std::exception_ptr{}),
  });

  auto r = resource<T>{std::move(state)};
  r.refresh();
  return r;
}

} // namespace ripple
