#pragma once

#include "engine.h"

#include <concepts>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

namespace ripple {

/// Disposes an effect or a root scope when invoked. Copies refer to the same
/// target; invoking a handle whose target is already gone does nothing.
class dispose_handle {
  std::weak_ptr<engine> owner;
  std::variant<node_id, scope_id> target;

public:
  dispose_handle() = default;
  dispose_handle(std::weak_ptr<engine> owner, node_id id)
      : owner{std::move(owner)}, target{id} {}
  dispose_handle(std::weak_ptr<engine> owner, scope_id id)
      : owner{std::move(owner)}, target{id} {}

  void operator()() const {
    if (auto e = owner.lock())
      std::visit([&](const auto id) { e->dispose(id); }, target);
  }

  auto disposed() const {
    auto e = owner.lock();
    return not e or
           not std::visit([&](const auto id) { return e->is_live(id); }, target);
  }
};

// An effect body returns nothing, or a cleanup that runs before the next
// execution and on disposal.
template <typename F>
concept effect_function =
    std::invocable<F &> and
    (std::is_void_v<std::invoke_result_t<F &>> or
     std::constructible_from<std::function<void()>, std::invoke_result_t<F &>>);

template <effect_function F> struct effect_state : computation {
  F f;

  explicit effect_state(F f) : f{std::move(f)} {}

  bool evaluate(engine &e) override {
    if constexpr (std::is_void_v<std::invoke_result_t<F &>>) {
      f();
    } else {
      auto cleanup = std::function<void()>{f()};
      if (cleanup)
        e.on_cleanup(std::move(cleanup));
    }
    return true;
  }
};

template <effect_function F>
auto make_effect(const std::shared_ptr<engine> &e, F f) {
  const auto id = e->add_effect(std::make_shared<effect_state<F>>(std::move(f)));
  return dispose_handle{e, id};
}

/// Calls `f(value)` whenever `source` (a cell, derived or linked cell) moves
/// to a new version. The current value is not reported.
template <typename Source, typename F>
  requires std::invocable<F &, const typename Source::value_type &>
auto subscribe(const Source &source, F f) {
  auto e = source.owner().lock();
  if (not e)
    throw disposed_error{
        fmt::format("runtime of {} was destroyed", source.id())};

  return make_effect(e, [source, f = std::move(f), initial = true,
                         owner = source.owner()]() mutable {
    const auto &value = source();
    if (std::exchange(initial, false))
      return;

    if (auto e = owner.lock())
      e->untrack([&] { f(value); });
  });
}

} // namespace ripple
