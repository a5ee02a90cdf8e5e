#pragma once

#include "config.h"
#include "containers.h"
#include "errors.h"
#include "log.h"

#include <fmt/format.h>

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <ranges>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace ripple {

struct node_tag;
struct scope_tag;

using node_id = slot_id<node_tag>;
using scope_id = slot_id<scope_tag>;

template <typename... Fs> struct overloaded : Fs... {
  using Fs::operator()...;
};
template <typename... Fs> overloaded(Fs...) -> overloaded<Fs...>;

template <typename F> struct scope_guard {
  F f;
  ~scope_guard() { f(); };
};

class engine;

/// Body of a derived cell or an effect. The engine sets up the execution
/// context before calling evaluate(); the result tells whether the node's
/// value changed (effects always report true).
struct computation {
  virtual ~computation() = default;
  virtual bool evaluate(engine &) = 0;
};

/// Type-erased view of a cell value, used for snapshots. The value itself is
/// owned by the cell handles, never by the engine.
struct cell_base {
  virtual ~cell_base() = default;

  // Returns a thunk that writes the current value back, or an empty function
  // if the value type cannot be copied.
  virtual std::function<void()> capture() = 0;
};

enum class node_kind {
  cell,
  derived,
  effect,
};

// A derived cell is `stale` when a transitive producer changed version and
// its dependencies must be re-checked, `dirty` when it has to recompute
// regardless (never evaluated, or explicitly invalidated).
enum class memo_state {
  clean,
  stale,
  dirty,
};

struct cell_data {
  std::weak_ptr<cell_base> value;
};

// A failed derived cell stays dirty and keeps forwarding staleness, so its
// readers are woken up by every change that may fix it.
struct derived_data {
  memo_state state = memo_state::dirty;
  bool evaluating = false;
  bool failed = false;
  std::weak_ptr<computation> body;
};

// A failed effect runs again on its next trigger without a version check.
struct effect_data {
  bool queued = false;
  bool failed = false;
  std::shared_ptr<computation> body;
};

struct node {
  std::variant<cell_data, derived_data, effect_data> data;
  std::uint64_t version = 0;

  // Consumers that read this node during their latest execution.
  insertion_order_set<node_id> subscribers = {};

  // Producers read during the latest execution, with the version observed.
  insertion_order_map<node_id, std::uint64_t> dependencies = {};

  scope_id owner = {};
  scope_id scope = {};
  bool disposed = false;

  auto kind() const { return static_cast<node_kind>(data.index()); }
};

struct scope {
  scope_id parent = {};
  node_id owner_node = {};
  std::vector<node_id> nodes = {};
  std::vector<std::function<void()>> cleanups = {};
  bool disposed = false;
};

struct runtime_stats {
  std::size_t cells = 0;
  std::size_t derived = 0;
  std::size_t effects = 0;
  std::size_t scopes = 0;
  std::uint64_t recomputations = 0;
  std::uint64_t effect_runs = 0;
  std::uint64_t flushes = 0;
  std::uint64_t errors = 0;
};

inline auto to_string(const node_kind kind) -> std::string_view {
  switch (kind) {
  case node_kind::cell:
    return "cell";
  case node_kind::derived:
    return "derived";
  case node_kind::effect:
    return "effect";
  }
  return "node";
}

} // namespace ripple

template <> struct fmt::formatter<ripple::node_id> {
  constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const ripple::node_id &id, FormatContext &ctx) const {
    if (not id)
      return fmt::format_to(ctx.out(), "node#-");
    return fmt::format_to(ctx.out(), "node#{}.{}", id.index, id.generation);
  }
};

template <> struct fmt::formatter<ripple::scope_id> {
  constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const ripple::scope_id &id, FormatContext &ctx) const {
    if (not id)
      return fmt::format_to(ctx.out(), "scope#-");
    return fmt::format_to(ctx.out(), "scope#{}.{}", id.index, id.generation);
  }
};

namespace ripple {

/// The reactive graph and its scheduler. One engine backs one runtime; the
/// execution context stack, the owner stack and the effect queue all live
/// here, so independent runtimes never observe each other.
///
/// Updates follow a two-phase protocol. A write bumps the cell's version and
/// pushes staleness through the subscriber edges: derived cells turn stale,
/// effects get queued. Nothing is recomputed at that point. Derived cells are
/// brought up to date when read (pull), queued effects when the outermost
/// batch ends (flush).
class engine : public std::enable_shared_from_this<engine> {
  runtime_config cfg;
  logger logs;

  slot_map<node_tag, node> nodes;
  slot_map<scope_tag, scope> scopes;

  // Execution context stack. An invalid id marks an untracked frame.
  std::vector<node_id> active_observers;
  std::vector<scope_id> active_owners;

  std::vector<node_id> queue;
  int batch_depth = 0;
  bool flushing = false;
  bool shutting_down = false;

  std::uint64_t recomputations = 0;
  std::uint64_t effect_runs = 0;
  std::uint64_t flushes = 0;
  std::uint64_t errors = 0;

public:
  explicit engine(runtime_config config)
      : cfg{std::move(config)}, logs{cfg.level, cfg.log_sink} {}

  engine(const engine &) = delete;
  engine &operator=(const engine &) = delete;

  const runtime_config &config() const { return cfg; }
  const logger &log() const { return logs; }

  // ---------------------------------------------------------------- nodes

  node_id add_cell(std::weak_ptr<cell_base> value) {
    const auto id = nodes.insert(node{cell_data{std::move(value)}});
    logs.trace("{} created (cell)", id);
    return id;
  }

  node_id add_derived(std::weak_ptr<computation> body) {
    const auto id = add_owned_node(derived_data{
        memo_state::dirty,
        false,
        false,
        std::move(body),
    });
    logs.trace("{} created (derived)", id);
    return id;
  }

  // Effects run once, immediately, as part of their creation.
  node_id add_effect(std::shared_ptr<computation> body) {
    const auto id = add_owned_node(effect_data{false, false, std::move(body)});
    logs.trace("{} created (effect)", id);
    execute(id);
    return id;
  }

  auto is_live(const node_id id) const {
    const auto *n = nodes.get(id);
    return n and not n->disposed;
  }

  auto is_live(const scope_id id) const {
    const auto *s = scopes.get(id);
    return s and not s->disposed;
  }

  /// Defers flushing until the outermost batch ends. The flush also runs
  /// when f throws.
  template <typename F> auto batch(F &&f) {
    ++batch_depth;
    if constexpr (std::is_void_v<std::invoke_result_t<F>>) {
      try {
        RIPPLE_FWD(f)();
      } catch (...) {
        end_batch();
        throw;
      }
      end_batch();
    } else {
      auto result = [&]() -> std::invoke_result_t<F> {
        try {
          return RIPPLE_FWD(f)();
        } catch (...) {
          end_batch();
          throw;
        }
      }();
      end_batch();
      return result;
    }
  }

  // Called by a handle's state when the last handle goes away.
  void release(const node_id id) {
    auto *n = nodes.get(id);
    if (not n)
      return;

    if (n->kind() != node_kind::cell) {
      batch([&] { dispose_node(id); });
      return;
    }

    logs.trace("{} released", id);
    for (const auto subscriber : n->subscribers)
      if (auto *s = nodes.get(subscriber))
        s->dependencies.erase(id);
    nodes.erase(id);
  }

  void dispose(const node_id id) {
    batch([&] { dispose_node(id); });
  }

  void dispose(const scope_id id) {
    batch([&] { dispose_scope(id); });
  }

  // --------------------------------------------------------- dependencies

  /// Registers `producer` as a dependency of the running computation, if any.
  void track(const node_id producer) {
    if (active_observers.empty())
      return;

    const auto observer = active_observers.back();
    if (not observer or observer == producer)
      return;

    auto *p = nodes.get(producer);
    auto *o = nodes.get(observer);
    if (not p or not o or o->disposed)
      return;

    o->dependencies[producer] = p->version;
    p->subscribers.insert(observer);
  }

  /// A cell's value changed: bump its version, push staleness downstream and
  /// flush unless a batch is open.
  void changed(const node_id id) {
    auto *n = nodes.get(id);
    if (not n)
      return;

    ++n->version;
    logs.trace("{} changed, version {}", id, n->version);
    mark_subscribers(id);

    if (batch_depth == 0)
      flush();
  }

  /// Brings a derived cell up to date. Throws disposed_error for a disposed
  /// node, cycle_error when the node is already evaluating, and whatever its
  /// body throws.
  void refresh(const node_id id) {
    auto *n = nodes.get(id);
    if (not n or n->disposed)
      throw disposed_error{fmt::format("derived cell {} was disposed", id)};

    auto *d = std::get_if<derived_data>(&n->data);
    if (not d)
      return;

    if (d->evaluating)
      throw cycle_error{
          fmt::format("derived cell {} depends on its own value", id)};

    if (d->state == memo_state::clean)
      return;

    if (d->state == memo_state::stale) {
      auto stale = true;
      try {
        stale = dependencies_changed(id);
      } catch (...) {
        fail(id);
        throw;
      }

      if (not stale) {
        if (auto *m = nodes.get(id))
          std::get<derived_data>(m->data).state = memo_state::clean;
        return;
      }
    }

    recompute(id);
  }

  auto version(const node_id id) const {
    const auto *n = nodes.get(id);
    return n ? n->version : std::uint64_t{};
  }

  /// The value of a derived cell was replaced from outside its body (linked
  /// cells). The node becomes clean and its subscribers are notified as if a
  /// cell had been written.
  void overridden(const node_id id) {
    auto *n = nodes.get(id);
    if (not n or n->disposed)
      throw disposed_error{fmt::format("derived cell {} was disposed", id)};

    auto &d = std::get<derived_data>(n->data);
    d.state = memo_state::clean;
    d.failed = false;
    for (auto &[producer, observed] : n->dependencies)
      if (const auto *p = nodes.get(producer))
        observed = p->version;

    changed(id);
  }

  /// Forces a derived cell to recompute now, notifying its subscribers if the
  /// recomputed value differs from the cached one.
  void invalidate(const node_id id) {
    auto *n = nodes.get(id);
    if (not n or n->disposed)
      throw disposed_error{fmt::format("derived cell {} was disposed", id)};

    std::get<derived_data>(n->data).state = memo_state::dirty;
    const auto before = n->version;
    refresh(id);

    if (version(id) == before)
      return;

    mark_subscribers(id);
    if (batch_depth == 0)
      flush();
  }

  // -------------------------------------------------------------- context

  template <typename F> decltype(auto) untrack(F &&f) {
    active_observers.emplace_back();
    auto _ = scope_guard{[this] { active_observers.pop_back(); }};
    return RIPPLE_FWD(f)();
  }

  auto in_batch() const { return batch_depth > 0; }

  void on_cleanup(std::function<void()> f) {
    auto *s = active_owners.empty() ? nullptr : scopes.get(active_owners.back());
    if (not s) {
      logs.warn("on_cleanup() called outside of any scope, callback dropped");
      return;
    }

    s->cleanups.push_back(std::move(f));
  }

  // Root scopes are detached: their parent is recorded for diagnostics only.
  scope_id create_scope() {
    const auto parent =
        active_owners.empty() ? scope_id{} : active_owners.back();
    const auto id = scopes.insert(scope{parent});
    logs.trace("{} created", id);
    return id;
  }

  /// Runs f untracked with `owner` as the current scope.
  template <typename F> decltype(auto) with_owner(const scope_id owner, F &&f) {
    active_observers.emplace_back();
    active_owners.push_back(owner);
    auto _ = scope_guard{[this] {
      active_observers.pop_back();
      active_owners.pop_back();
    }};
    return RIPPLE_FWD(f)();
  }

  // ------------------------------------------------------------ scheduler

  /// Drains the effect queue. Effects queued while draining run in later
  /// rounds of the same flush; more than max_flush_iterations rounds raise
  /// runaway_flush_error.
  void flush() {
    if (flushing or shutting_down or queue.empty())
      return;

    flushing = true;
    ++flushes;
    logs.trace("flush started, {} effects queued", queue.size());

    auto round = std::vector<node_id>{};
    auto position = std::size_t{};
    auto rounds = 0;

    try {
      while (not queue.empty()) {
        if (++rounds > cfg.max_flush_iterations) {
          logs.error("flush exceeded {} rounds, dropping {} queued effects",
                     cfg.max_flush_iterations, queue.size());
          throw runaway_flush_error{
              fmt::format("flush exceeded {} rounds; an effect keeps "
                          "re-triggering itself",
                          cfg.max_flush_iterations),
              rounds - 1};
        }

        round = std::exchange(queue, {});
        for (position = 0; position < round.size(); ++position)
          run_queued(round[position]);
        round.clear();
      }
    } catch (...) {
      for (; position < round.size(); ++position)
        unqueue(round[position]);
      for (const auto id : queue)
        unqueue(id);
      queue.clear();
      flushing = false;
      throw;
    }

    flushing = false;
    logs.trace("flush finished after {} rounds", rounds);
  }

  // ------------------------------------------------------------ lifecycle

  /// Disposes every scope and effect, running their cleanups. Nothing is
  /// scheduled afterwards.
  void shutdown() {
    shutting_down = true;
    for (const auto id : queue)
      unqueue(id);
    queue.clear();

    auto roots = std::vector<scope_id>{};
    scopes.for_each([&](const scope_id id, const scope &s) {
      if (not s.owner_node)
        roots.push_back(id);
    });
    for (const auto id : roots)
      dispose_scope(id);

    auto rest = std::vector<node_id>{};
    nodes.for_each([&](const node_id id, const node &n) {
      if (n.kind() != node_kind::cell)
        rest.push_back(id);
    });
    for (const auto id : rest)
      dispose_node(id);

    logs.info("runtime shut down");
  }

  auto stats() const {
    auto result = runtime_stats{};
    nodes.for_each([&](node_id, const node &n) {
          switch (n.kind()) {
          case node_kind::cell:
            ++result.cells;
            break;
          case node_kind::derived:
            ++result.derived;
            break;
          case node_kind::effect:
            ++result.effects;
            break;
          }
        });
    result.scopes = scopes.size();
    result.recomputations = recomputations;
    result.effect_runs = effect_runs;
    result.flushes = flushes;
    result.errors = errors;
    return result;
  }

  /// Restore thunks for every live cell with a copyable value.
  auto capture_cells() {
    auto thunks = std::vector<std::function<void()>>{};
    nodes.for_each([&](node_id, node &n) {
      if (auto *c = std::get_if<cell_data>(&n.data))
        if (auto value = c->value.lock())
          if (auto thunk = value->capture())
            thunks.push_back(std::move(thunk));
    });
    return thunks;
  }

private:
  node_id add_owned_node(std::variant<cell_data, derived_data, effect_data> data) {
    const auto owner =
        active_owners.empty() ? scope_id{} : active_owners.back();
    const auto id = nodes.insert(node{std::move(data)});
    const auto body_scope = scopes.insert(scope{owner, id});

    auto *n = nodes.get(id);
    n->owner = owner;
    n->scope = body_scope;

    if (auto *s = scopes.get(owner))
      s->nodes.push_back(id);

    return id;
  }

  void end_batch() {
    if (--batch_depth == 0)
      flush();
  }

  void mark_subscribers(const node_id producer) {
    const auto *p = nodes.get(producer);
    if (not p)
      return;

    // copy, because marking may modify the subscriber list
    const auto subscribers = p->subscribers;
    for (const auto subscriber : subscribers)
      mark_stale(subscriber);
  }

  void mark_stale(const node_id id) {
    auto *n = nodes.get(id);
    if (not n or n->disposed)
      return;

    std::visit(overloaded{
                   [](cell_data &) {},
                   [&](derived_data &d) {
                     // Propagate only on the first visit; a stale node has
                     // already marked everything downstream.
                     if (d.state == memo_state::clean)
                       d.state = memo_state::stale;
                     else if (not d.failed)
                       return;

                     mark_subscribers(id);
                   },
                   [&](effect_data &e) {
                     if (std::exchange(e.queued, true))
                       return;

                     queue.push_back(id);
                   },
               },
               n->data);
  }

  void fail(const node_id id) {
    if (auto *n = nodes.get(id))
      if (auto *d = std::get_if<derived_data>(&n->data)) {
        d->state = memo_state::dirty;
        d->failed = true;
      }
  }

  void unqueue(const node_id id) {
    if (auto *n = nodes.get(id))
      if (auto *e = std::get_if<effect_data>(&n->data))
        e->queued = false;
  }

  // Whether any producer moved past the version observed during the node's
  // latest execution. Derived producers are refreshed first, so that a memo
  // which recomputed to an equal value keeps its consumers quiet.
  bool dependencies_changed(const node_id id) {
    const auto dependencies = nodes.get(id)->dependencies;
    for (const auto &[producer, observed] : dependencies) {
      const auto *p = nodes.get(producer);
      if (not p)
        return true;

      if (p->kind() == node_kind::derived) {
        refresh(producer);
        p = nodes.get(producer);
        if (not p)
          return true;
      }

      if (p->version != observed)
        return true;
    }
    return false;
  }

  void unsubscribe_stale(const node_id id,
                         const insertion_order_map<node_id, std::uint64_t> &previous,
                         const insertion_order_map<node_id, std::uint64_t> &current) {
    for (const auto &[producer, _] : previous) {
      if (current.contains(producer))
        continue;

      if (auto *p = nodes.get(producer))
        p->subscribers.erase(id);
    }
  }

  void recompute(const node_id id) {
    auto *n = nodes.get(id);
    auto &d = std::get<derived_data>(n->data);

    auto body = d.body.lock();
    if (not body)
      throw disposed_error{fmt::format("derived cell {} was disposed", id)};

    // The state is cleared before evaluation, so that writes performed by the
    // body to its own producers leave the node stale afterwards.
    d.state = memo_state::clean;
    d.evaluating = true;
    const auto body_scope = n->scope;

    ++batch_depth;
    reset_scope(body_scope);

    auto previous = std::exchange(nodes.get(id)->dependencies, {});
    auto value_changed = false;

    try {
      active_observers.push_back(id);
      active_owners.push_back(body_scope);
      auto _ = scope_guard{[this] {
        active_observers.pop_back();
        active_owners.pop_back();
      }};

      value_changed = body->evaluate(*this);
    } catch (...) {
      // Roll back to the previous dependency set. The cached value was never
      // touched; the node stays dirty until a recompute succeeds.
      if (auto *m = nodes.get(id)) {
        unsubscribe_stale(id, m->dependencies, previous);
        m->dependencies = std::move(previous);

        auto &md = std::get<derived_data>(m->data);
        md.state = memo_state::dirty;
        md.failed = true;
        md.evaluating = false;
      }
      logs.debug("{} failed to recompute: {}", id,
                 describe(std::current_exception()));
      end_batch();
      throw;
    }

    if (auto *m = nodes.get(id)) {
      unsubscribe_stale(id, previous, m->dependencies);
      auto &md = std::get<derived_data>(m->data);
      md.evaluating = false;
      // Readers that saw the failure must re-run even when the value came
      // back unchanged.
      if (value_changed or std::exchange(md.failed, false))
        ++m->version;
    }

    ++recomputations;
    logs.trace("{} recomputed, changed: {}", id, value_changed);
    end_batch();
  }

  void run_queued(const node_id id) {
    auto *n = nodes.get(id);
    if (not n or n->disposed)
      return;

    auto &e = std::get<effect_data>(n->data);
    e.queued = false;

    if (e.failed) {
      execute(id);
      return;
    }

    // A failing derived producer counts as a change: the body reads it again
    // and decides how to handle the failure.
    auto stale = true;
    try {
      stale = dependencies_changed(id);
    } catch (const std::exception &ex) {
      logs.debug("{} dependency check failed: {}", id, ex.what());
    }

    if (not stale) {
      logs.trace("{} skipped, dependencies unchanged", id);
      return;
    }

    execute(id);
  }

  void execute(const node_id id) {
    auto *n = nodes.get(id);
    if (not n or n->disposed)
      return;

    // Keep the body alive in case the effect disposes itself.
    auto body = std::get<effect_data>(n->data).body;
    const auto body_scope = n->scope;

    ++batch_depth;
    reset_scope(body_scope);

    auto previous = std::exchange(nodes.get(id)->dependencies, {});
    auto failed = false;

    try {
      active_observers.push_back(id);
      active_owners.push_back(body_scope);
      auto _ = scope_guard{[this] {
        active_observers.pop_back();
        active_owners.pop_back();
      }};

      body->evaluate(*this);
    } catch (...) {
      failed = true;
      report(id, std::current_exception());
    }

    if (auto *m = nodes.get(id)) {
      if (failed) {
        // Keep listening to everything read so far and to everything read
        // by the last successful run, so the effect gets another chance.
        for (const auto &[producer, observed] : previous)
          if (not m->dependencies.contains(producer))
            m->dependencies[producer] = observed;
      } else {
        unsubscribe_stale(id, previous, m->dependencies);
      }
      std::get<effect_data>(m->data).failed = failed;
    } else {
      // Disposed during its own run.
      for (const auto &[producer, _] : previous)
        if (auto *p = nodes.get(producer))
          p->subscribers.erase(id);
    }

    ++effect_runs;
    end_batch();
  }

  void report(const node_id id, std::exception_ptr cause) {
    ++errors;
    const auto err = recompute_error{
        fmt::format("{} failed: {}", id, describe(cause)), std::move(cause)};

    if (cfg.on_error) {
      try {
        cfg.on_error(err);
      } catch (const std::exception &ex) {
        logs.error("error handler threw while handling {}: {}", id, ex.what());
      }
      return;
    }

    logs.error("{}", err.what());
  }

  // Disposes the nodes created by the previous run of a computation and runs
  // the cleanups it registered. The scope itself stays usable.
  void reset_scope(const scope_id id) {
    auto *s = scopes.get(id);
    if (not s)
      return;

    const auto owned = std::exchange(s->nodes, {});
    for (const auto child : owned | std::views::reverse)
      dispose_node(child);

    s = scopes.get(id);
    if (not s)
      return;

    const auto owner = s->owner_node;
    const auto cleanups = std::exchange(s->cleanups, {});
    for (const auto &cleanup : cleanups | std::views::reverse) {
      try {
        cleanup();
      } catch (...) {
        report(owner, std::current_exception());
      }
    }
  }

  // Children first (latest created first), then this scope's cleanups in
  // reverse registration order.
  void dispose_scope(const scope_id id) {
    auto *s = scopes.get(id);
    if (not s or s->disposed)
      return;

    s->disposed = true;
    logs.trace("{} disposed", id);
    reset_scope(id);
    scopes.erase(id);
  }

  void dispose_node(const node_id id) {
    auto *n = nodes.get(id);
    if (not n or n->disposed)
      return;

    n->disposed = true;
    logs.trace("{} disposed ({})", id, to_string(n->kind()));

    dispose_scope(n->scope);

    n = nodes.get(id);
    if (not n)
      return;

    // Sever from producers, so the node can never be re-triggered.
    for (const auto &[producer, _] : n->dependencies)
      if (auto *p = nodes.get(producer))
        p->subscribers.erase(id);
    n->dependencies.clear();

    if (auto *owner = scopes.get(n->owner))
      std::erase(owner->nodes, id);

    nodes.erase(id);
  }
};

} // namespace ripple
