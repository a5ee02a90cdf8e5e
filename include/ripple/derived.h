#pragma once

#include "cell.h"
#include "engine.h"

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace ripple {

template <typename T> struct derived_state : computation {
  std::weak_ptr<engine> owner;
  node_id id;
  std::function<T()> f;
  std::optional<T> value;
  equals_t<T> equals;

  derived_state(std::weak_ptr<engine> owner, std::function<T()> f,
                equals_t<T> equals)
      : owner{std::move(owner)}, f{std::move(f)}, equals{std::move(equals)} {}

  ~derived_state() { release(); }

  // The fresh value is only committed once the body returned, so a throwing
  // body leaves the cached value untouched.
  bool evaluate(engine &) override {
    auto next = std::optional<T>{std::in_place, f()};
    if (value and equals(*value, *next))
      return false;

    value = std::move(next);
    return true;
  }

protected:
  void release() {
    auto e = owner.lock();
    if (not e)
      return;

    try {
      e->release(id);
    } catch (const std::exception &ex) {
      e->log().error("releasing {} failed: {}", id, ex.what());
    }
  }
};

struct linked_options {
  // Discard a manual override as soon as a dependency changes.
  bool reset_on_change = true;
};

template <typename T> struct linked_state : derived_state<T> {
  linked_options options;
  bool overridden = false;

  linked_state(std::weak_ptr<engine> owner, std::function<T()> f,
               equals_t<T> equals, linked_options options)
      : derived_state<T>{std::move(owner), std::move(f), std::move(equals)},
        options{options} {}

  bool evaluate(engine &e) override {
    // Not reading anything drops every dependency; reset() brings them back.
    if (overridden and not options.reset_on_change)
      return false;

    const auto changed = derived_state<T>::evaluate(e);
    overridden = false;
    return changed;
  }
};

inline auto lock_owner(const std::weak_ptr<engine> &owner, const node_id id) {
  auto e = owner.lock();
  if (not e)
    throw disposed_error{fmt::format("runtime of {} was destroyed", id)};
  return e;
}

/// Read-only handle to a lazily computed, memoized value.
template <typename T> class derived {
protected:
  std::shared_ptr<derived_state<T>> state;

public:
  using value_type = T;

  explicit derived(std::shared_ptr<derived_state<T>> state)
      : state{std::move(state)} {}

  /// Recomputes if a dependency changed since the last evaluation, and
  /// registers this cell as a dependency of the running computation.
  const T &read() const {
    auto e = lock_owner(state->owner, state->id);

    // Bring the value up to date before linking, so that the version
    // recorded by the reader is the one it actually observed. A reader that
    // saw a failure still depends on the cell, to learn about its recovery.
    try {
      e->refresh(state->id);
    } catch (...) {
      e->track(state->id);
      throw;
    }
    e->track(state->id);
    return *state->value;
  }

  const T &operator()() const { return read(); }

  const T &peek() const {
    auto e = lock_owner(state->owner, state->id);
    e->refresh(state->id);
    return *state->value;
  }

  auto id() const { return state->id; }
  auto owner() const { return state->owner; }
};

/// A derived cell that can be overridden by hand until its dependencies
/// change (or until reset(), see linked_options).
template <typename T> class linked : public derived<T> {
  auto &self() const { return static_cast<linked_state<T> &>(*this->state); }

public:
  explicit linked(std::shared_ptr<linked_state<T>> state)
      : derived<T>{std::move(state)} {}

  template <typename U>
    requires std::convertible_to<U, T>
  void set(U &&value) const {
    auto e = lock_owner(this->state->owner, this->state->id);
    auto &s = self();

    e->refresh(s.id);
    if (s.value and s.equals(*s.value, value))
      return;

    s.value.emplace(RIPPLE_FWD(value));
    s.overridden = true;
    e->overridden(s.id);
  }

  template <typename F>
    requires std::invocable<F, const T &>
  void update(F f) const {
    set(T(f(this->peek())));
  }

  void reset() const {
    auto e = lock_owner(this->state->owner, this->state->id);
    self().overridden = false;
    e->invalidate(this->state->id);
  }

  auto is_overridden() const { return self().overridden; }
};

template <typename F>
using result_t = std::remove_cvref_t<std::invoke_result_t<F &>>;

template <typename F>
auto make_derived(const std::shared_ptr<engine> &e, F f,
                  equals_t<result_t<F>> equals = default_equals<result_t<F>>()) {
  using T = result_t<F>;
  auto state = std::make_shared<derived_state<T>>(
      e, std::function<T()>{std::move(f)}, std::move(equals));
  state->id = e->add_derived(state);
  return derived<T>{std::move(state)};
}

template <typename F>
auto make_linked(const std::shared_ptr<engine> &e, F f,
                 linked_options options = {},
                 equals_t<result_t<F>> equals = default_equals<result_t<F>>()) {
  using T = result_t<F>;
  auto state = std::make_shared<linked_state<T>>(
      e, std::function<T()>{std::move(f)}, std::move(equals), options);
  state->id = e->add_derived(state);
  return linked<T>{std::move(state)};
}

} // namespace ripple
