#pragma once

#include "cell.h"
#include "config.h"
#include "derived.h"
#include "effect.h"
#include "engine.h"
#include "resource.h"

#include <concepts>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace ripple {

/// Values captured by runtime::snapshot().
struct snapshot_t {
  std::vector<std::function<void()>> restores;

  auto size() const { return restores.size(); }
};

/// Owns one reactive graph. Every cell, derived cell, effect and scope is
/// created through a runtime and only ever interacts with nodes of the same
/// runtime. Handles may outlive the runtime: reading a derived cell then
/// throws disposed_error, cells keep their last value.
class runtime {
  std::shared_ptr<engine> core;

public:
  explicit runtime(runtime_config config = {})
      : core{std::make_shared<engine>(std::move(config))} {}

  ~runtime() {
    if (not core)
      return;

    try {
      core->shutdown();
    } catch (const std::exception &ex) {
      core->log().error("shutdown failed: {}", ex.what());
    }
  }

  runtime(const runtime &) = delete;
  runtime &operator=(const runtime &) = delete;
  runtime(runtime &&) = default;

  template <typename T> auto cell(T initial) {
    return make_cell<T>(core, std::move(initial));
  }

  template <typename T, typename Eq>
    requires std::predicate<Eq &, const T &, const T &>
  auto cell(T initial, Eq equals) {
    return make_cell<T>(core, std::move(initial), equals_t<T>{std::move(equals)});
  }

  template <typename F> auto derived(F f) { return make_derived(core, std::move(f)); }

  template <typename F, typename Eq> auto derived(F f, Eq equals) {
    return make_derived(core, std::move(f),
                        equals_t<result_t<F>>{std::move(equals)});
  }

  template <typename F> auto linked(F f, linked_options options = {}) {
    return make_linked(core, std::move(f), options);
  }

  /// Fetches once now; fetch again with refresh().
  template <typename F> auto resource(F f) {
    return make_resource(core, std::move(f));
  }

  /// Runs f now and again after every flush in which something it read
  /// changed. The returned handle disposes the effect.
  template <effect_function F> auto effect(F f) {
    return make_effect(core, std::move(f));
  }

  /// Defers every flush until the outermost batch returns. The flush still
  /// happens if f throws.
  template <typename F> auto batch(F &&f) { return core->batch(RIPPLE_FWD(f)); }

  /// Runs f without registering any read as a dependency.
  template <typename F> decltype(auto) untrack(F &&f) {
    return core->untrack(RIPPLE_FWD(f));
  }

  /// Registers f with the scope of the running computation or root.
  void on_cleanup(std::function<void()> f) { core->on_cleanup(std::move(f)); }

  /// Runs f inside a new root scope. f may take the scope's dispose_handle.
  /// If f throws, the scope is disposed before the exception propagates.
  template <typename F> decltype(auto) create_root(F &&f) {
    const auto id = core->create_scope();
    auto dispose = dispose_handle{core, id};

    try {
      return core->with_owner(id, [&]() -> decltype(auto) {
        if constexpr (std::invocable<F, dispose_handle>)
          return RIPPLE_FWD(f)(dispose);
        else
          return RIPPLE_FWD(f)();
      });
    } catch (...) {
      core->dispose(id);
      throw;
    }
  }

  auto snapshot() { return snapshot_t{core->capture_cells()}; }

  /// Writes back every value of the snapshot whose cell is still alive, as
  /// one batch.
  void restore(const snapshot_t &snapshot) {
    core->batch([&] {
      for (const auto &restore : snapshot.restores)
        restore();
    });
  }

  auto stats() const { return core->stats(); }
  auto in_batch() const { return core->in_batch(); }
  const logger &log() const { return core->log(); }
  const runtime_config &config() const { return core->config(); }
};

} // namespace ripple
