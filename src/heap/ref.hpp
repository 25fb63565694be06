#pragma once

#include "heap/closure.hpp"

namespace gp::heap {

/// Handle to a graph root whose value has logical type T. T never appears at
/// runtime; it selects the type identity checked when packets are decoded.
template <typename T>
class Ref {
public:
  using value_type = T;

  Ref() = default;
  explicit Ref(Closure *node) : node_(node) {}

  auto node() const -> Closure * { return node_; }
  explicit operator bool() const { return node_ != nullptr; }

private:
  Closure *node_ = nullptr;
};

/// Logical type of a cons list (Nil = tag 0, Cons head tail = tag 1).
template <typename T>
struct List {};

/// Logical type of a mutable cell holding a T.
template <typename T>
struct Cell {};

/// Logical type of an opaque native resource.
struct ForeignHandle {};

} // namespace gp::heap
