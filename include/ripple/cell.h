#pragma once

#include "engine.h"

#include <concepts>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace ripple {

template <typename T>
using equals_t = std::function<bool(const T &, const T &)>;

/// Equality used when none is supplied: operator== where the type has one,
/// otherwise every write counts as a change.
template <typename T> auto default_equals() -> equals_t<T> {
  if constexpr (std::equality_comparable<T>) {
    return [](const T &lhs, const T &rhs) { return lhs == rhs; };
  } else {
    return [](const T &, const T &) { return false; };
  }
}

template <typename T>
struct cell_state : cell_base, std::enable_shared_from_this<cell_state<T>> {
  std::weak_ptr<engine> owner;
  node_id id;
  T value;
  equals_t<T> equals;

  cell_state(std::weak_ptr<engine> owner, T value, equals_t<T> equals)
      : owner{std::move(owner)}, value{std::move(value)},
        equals{std::move(equals)} {}

  ~cell_state() {
    if (auto e = owner.lock())
      e->release(id);
  }

  template <typename U> void assign(U &&next) {
    auto e = owner.lock();
    if (equals(value, next)) {
      if (e)
        e->log().trace("write to {} ignored, value unchanged", id);
      return;
    }

    value = RIPPLE_FWD(next);
    if (e)
      e->changed(id);
  }

  std::function<void()> capture() override {
    if constexpr (std::copy_constructible<T>) {
      return [self = this->weak_from_this(), saved = value] {
        if (auto s = self.lock())
          s->assign(saved);
      };
    } else {
      return {};
    }
  }
};

/// Handle to a reactive cell. Copies share the same value; the cell lives as
/// long as any handle does.
template <typename T> class cell {
  std::shared_ptr<cell_state<T>> state;

public:
  using value_type = T;

  explicit cell(std::shared_ptr<cell_state<T>> state) : state{std::move(state)} {}

  cell(const cell &) = default;
  cell(cell &&) = default;

  // Disallow assignment from cells. That would silently rewire every
  // computation that captured this handle.
  cell &operator=(const cell &) = delete;
  cell &operator=(cell &&) = delete;

  /// Returns the current value and, inside a computation, registers the cell
  /// as its dependency.
  const T &read() const {
    if (auto e = state->owner.lock())
      e->track(state->id);
    return state->value;
  }

  const T &operator()() const { return read(); }

  /// Returns the current value without registering a dependency.
  const T &peek() const {
    if (auto e = state->owner.lock())
      return e->untrack([&]() -> const T & { return read(); });
    return state->value;
  }

  template <typename U>
    requires std::convertible_to<U, T>
  void set(U &&value) const {
    state->assign(RIPPLE_FWD(value));
  }

  template <typename F>
    requires std::invocable<F, const T &>
  void update(F f) const {
    set(T(f(state->value)));
  }

  template <typename U>
    requires std::convertible_to<U, T> and
             (not std::same_as<std::remove_cvref_t<U>, cell>)
  cell &operator=(U &&value) {
    set(RIPPLE_FWD(value));
    return *this;
  }

  auto id() const { return state->id; }
  auto owner() const { return state->owner; }
};

template <typename T>
auto make_cell(const std::shared_ptr<engine> &e, T initial,
               equals_t<T> equals = default_equals<T>()) {
  auto state = std::make_shared<cell_state<T>>(e, std::move(initial),
                                               std::move(equals));
  state->id = e->add_cell(state);
  return cell<T>{std::move(state)};
}

} // namespace ripple
