#pragma once
#include <spdlog/spdlog.h>
#include <strata/common/error.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace strata::schema {

/// Bijective key <-> identifier map with lazy identifier generation.
///
/// Identifiers come from the generator the first time an unseen key is
/// looked up, unless `put` bound one explicitly. Generation happens in
/// first-seen order, so the same generator and the same lookup order always
/// produce the same identifiers.
///
/// Replacing the generator leaves every cached identifier untouched and only
/// marks the registry stale. Callers must run `rebuild()` afterwards, or old
/// and new identifiers will coexist.
template <typename Key, typename Id, typename Conflict = conflict_error>
class identifier_registry final {
 public:
  /// `sequence` counts generation attempts since construction or the last
  /// rebuild.
  using generator_t = std::function<Id(const Key& key, uint64_t sequence)>;

  explicit identifier_registry(generator_t generator)
      : generator_(std::move(generator)) {}

  const Id& get(const Key& key) {
    if (auto it = forward_.find(key); it != std::end(forward_)) {
      return it->second.id;
    }
    return generate(key);
  }

  std::optional<Id> find(const Key& key) const {
    if (auto it = forward_.find(key); it != std::end(forward_)) {
      return it->second.id;
    }
    return std::nullopt;
  }

  const Key& get_by_identifier(const Id& id) const {
    auto it = backward_.find(id);
    if (it == std::end(backward_)) {
      throw std::out_of_range{"identifier is not bound to any key"};
    }
    return it->second;
  }

  std::optional<Key> find_by_identifier(const Id& id) const {
    if (auto it = backward_.find(id); it != std::end(backward_)) {
      return it->second;
    }
    return std::nullopt;
  }

  /// Bind `key` to `id` explicitly. Explicit bindings survive `rebuild()`.
  void put(const Key& key, const Id& id) {
    if (auto owner = backward_.find(id); owner != std::end(backward_)) {
      if (owner->second != key) {
        throw Conflict{
            fmt::format("identifier {} is already bound to another key", id)};
      }
      forward_.at(key).is_explicit = true;
      return;
    }
    if (auto it = forward_.find(key); it != std::end(forward_)) {
      backward_.erase(it->second.id);
      it->second = binding{id, true};
    } else {
      forward_.emplace(key, binding{id, true});
      order_.push_back(key);
    }
    backward_.emplace(id, key);
  }

  void set_generator(generator_t generator) {
    generator_ = std::move(generator);
    stale_ = true;
  }

  /// Drop every generated identifier and regenerate them, in the order their
  /// keys were first seen, with the current generator.
  void rebuild() {
    auto rebuilt = identifier_registry{generator_};
    for (const auto& key : order_) {
      const auto& current = forward_.at(key);
      if (current.is_explicit) {
        rebuilt.forward_.emplace(key, current);
        rebuilt.backward_.emplace(current.id, key);
        rebuilt.order_.push_back(key);
      }
    }
    for (const auto& key : order_) {
      if (!forward_.at(key).is_explicit) {
        rebuilt.generate(key);
      }
    }
    // Restore first-seen order; generate() appended the regenerated keys.
    rebuilt.order_ = order_;
    *this = std::move(rebuilt);
  }

  bool remove(const Key& key) {
    auto it = forward_.find(key);
    if (it == std::end(forward_)) {
      return false;
    }
    backward_.erase(it->second.id);
    forward_.erase(it);
    std::erase(order_, key);
    return true;
  }

  void clear() {
    forward_.clear();
    backward_.clear();
    order_.clear();
    sequence_ = 0;
    stale_ = false;
  }

  bool contains(const Key& key) const { return forward_.contains(key); }

  bool is_explicit(const Key& key) const {
    auto it = forward_.find(key);
    return it != std::end(forward_) && it->second.is_explicit;
  }

  /// True after `set_generator` until the next `rebuild()`.
  bool stale() const { return stale_; }

  size_t size() const { return forward_.size(); }

  /// Every binding in first-seen order.
  std::vector<std::pair<Key, Id>> entries() const {
    auto out = std::vector<std::pair<Key, Id>>{};
    out.reserve(order_.size());
    for (const auto& key : order_) {
      out.emplace_back(key, forward_.at(key).id);
    }
    return out;
  }

 private:
  struct binding final {
    Id id{};
    bool is_explicit{false};
  };

  // Identifiers already taken are skipped by asking the generator again with
  // the next sequence number. A generator that cannot escape the bound set
  // within size() + 1 attempts is a conflict.
  const Id& generate(const Key& key) {
    auto attempts = size_t{0};
    while (true) {
      auto id = generator_(key, sequence_++);
      if (!backward_.contains(id)) {
        auto [it, inserted] = forward_.emplace(key, binding{id, false});
        backward_.emplace(id, key);
        order_.push_back(key);
        return it->second.id;
      }
      if (++attempts > backward_.size()) {
        throw Conflict{fmt::format(
            "generator produced only bound identifiers, last was {}", id)};
      }
    }
  }

  generator_t generator_;
  std::map<Key, binding> forward_;
  std::map<Id, Key> backward_;
  std::vector<Key> order_;
  uint64_t sequence_{0};
  bool stale_{false};
};

/// Counter generator: base, base + 1, ... in sequence order, whatever the key.
template <typename Key, typename Id>
std::function<Id(const Key&, uint64_t)> make_counter_generator(const Id base) {
  return [base](const Key&, const uint64_t sequence) {
    return static_cast<Id>(base + sequence);
  };
}

}  // namespace strata::schema
