#pragma once

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <deque>
#include <functional>
#include <utility>
#include <vector>

#define RIPPLE_FWD(x) std::forward<decltype(x)>(x)

namespace ripple {

// Associative container that iterates in insertion order. Subscriber and
// dependency lists are small, so a linear scan beats a tree here, and the
// order keeps notification and re-check order deterministic.
template <typename Key, typename Value, typename Comparator = std::less<Key>>
class insertion_order_map {
  std::vector<std::pair<Key, Value>> nodes;

  static auto equivalent(const Key &lhs, const Key &rhs) {
    auto cmp = Comparator{};
    return not cmp(lhs, rhs) and not cmp(rhs, lhs);
  }

  auto find_node(const Key &key) {
    return std::ranges::find_if(
        nodes, [&](auto &k) { return equivalent(k, key); },
        &std::pair<Key, Value>::first);
  }

  auto find_node(const Key &key) const {
    return std::ranges::find_if(
        nodes, [&](auto &k) { return equivalent(k, key); },
        &std::pair<Key, Value>::first);
  }

public:
  auto size() const { return nodes.size(); }
  auto empty() const { return nodes.empty(); }
  auto begin() { return nodes.begin(); }
  auto end() { return nodes.end(); }
  auto begin() const { return nodes.begin(); }
  auto end() const { return nodes.end(); }

  auto &operator[](const Key &key) {
    auto it = find_node(key);
    if (it != nodes.end()) {
      return it->second;
    }

    return nodes.emplace_back(key, Value{}).second;
  }

  auto contains(const Key &key) const { return find_node(key) != nodes.end(); }

  auto erase(const Key &key) {
    auto it = find_node(key);
    if (it == nodes.end())
      return false;

    nodes.erase(it);
    return true;
  }

  void clear() { nodes.clear(); }
};

template <typename T, typename Comparator = std::less<T>>
struct insertion_order_set {
  std::vector<T> nodes;

  auto size() const { return nodes.size(); }
  auto empty() const { return nodes.empty(); }
  auto begin() const { return nodes.begin(); }
  auto end() const { return nodes.end(); }
  auto contains(const T &value) const {
    return std::ranges::find_if(nodes, [&](auto &k) {
             auto cmp = Comparator{};
             return not cmp(k, value) and not cmp(value, k);
           }) != nodes.end();
  }
  auto insert(const T &value) {
    if (contains(value))
      return false;

    nodes.push_back(value);
    return true;
  }
  auto erase(const T &value) {
    auto it = std::ranges::find_if(nodes, [&](auto &k) {
      auto cmp = Comparator{};
      return not cmp(k, value) and not cmp(value, k);
    });
    if (it == nodes.end())
      return false;

    nodes.erase(it);
    return true;
  }
};

/// Generational index into a slot_map. A released slot bumps its generation,
/// so ids handed out before the release stop resolving.
template <typename Tag> struct slot_id {
  static constexpr auto npos = std::uint32_t(-1);

  std::uint32_t index = npos;
  std::uint32_t generation = 0;

  constexpr auto valid() const { return index != npos; }
  constexpr explicit operator bool() const { return valid(); }

  friend constexpr auto operator<=>(const slot_id &, const slot_id &) = default;
};

// Arena with stable element addresses: slots live in a deque, which never
// relocates on growth, and released slots are recycled through a free list.
template <typename Tag, typename T> class slot_map {
  struct slot {
    T value;
    std::uint32_t generation = 0;
    bool occupied = false;
  };

  std::deque<slot> slots;
  std::vector<std::uint32_t> free_list;
  std::size_t live = 0;

public:
  using id_t = slot_id<Tag>;

  auto size() const { return live; }

  auto insert(T value) {
    auto index = std::uint32_t{};
    if (free_list.empty()) {
      index = static_cast<std::uint32_t>(slots.size());
      slots.emplace_back();
    } else {
      index = free_list.back();
      free_list.pop_back();
    }

    auto &s = slots[index];
    assert(not s.occupied);
    s.value = std::move(value);
    s.occupied = true;
    ++live;

    return id_t{index, s.generation};
  }

  T *get(id_t id) {
    if (not id or id.index >= slots.size())
      return nullptr;

    auto &s = slots[id.index];
    if (not s.occupied or s.generation != id.generation)
      return nullptr;

    return &s.value;
  }

  const T *get(id_t id) const {
    return const_cast<slot_map *>(this)->get(id);
  }

  auto contains(id_t id) const { return get(id) != nullptr; }

  // Moves the value out before the slot is recycled, so that destructors
  // running as a consequence of the release never observe a half-erased slot.
  auto erase(id_t id) {
    auto *value = get(id);
    if (not value)
      return false;

    auto released = std::move(*value);
    auto &s = slots[id.index];
    s.value = T{};
    s.occupied = false;
    ++s.generation;
    free_list.push_back(id.index);
    --live;

    return true;
  }

  template <typename F> void for_each(F f) {
    for (auto index = std::uint32_t{}; index < slots.size(); ++index) {
      auto &s = slots[index];
      if (s.occupied)
        f(id_t{index, s.generation}, s.value);
    }
  }

  template <typename F> void for_each(F f) const {
    for (auto index = std::uint32_t{}; index < slots.size(); ++index) {
      const auto &s = slots[index];
      if (s.occupied)
        f(id_t{index, s.generation}, s.value);
    }
  }
};

} // namespace ripple
