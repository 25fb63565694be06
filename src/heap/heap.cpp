#include "heap/heap.hpp"

#include <stdexcept>
#include <utility>

#include "common/logging/log.hpp"
#include "heap/code_table.hpp"

namespace gp::heap {

Heap::~Heap() = default;

auto Heap::allocate(ClosureKind kind) -> Closure * {
  auto node = std::make_unique<Closure>(kind);
  auto *raw = node.get();
  std::lock_guard lock(alloc_mutex_);
  closures_.push_back(std::move(node));
  return raw;
}

auto Heap::make_int(std::int64_t value) -> Closure * {
  auto *node = allocate(ClosureKind::Int);
  node->value = value;
  return node;
}

auto Heap::make_con(std::uint32_t tag, std::vector<Closure *> fields) -> Closure * {
  for (auto *field : fields) {
    if (!field) {
      throw std::invalid_argument("constructor field is null");
    }
  }
  auto *node = allocate(ClosureKind::Con);
  node->tag = tag;
  node->fields = std::move(fields);
  return node;
}

auto Heap::make_thunk(ThunkCode code, std::vector<Closure *> env) -> Closure * {
  if (!code) {
    throw std::invalid_argument("thunk code is null");
  }
  for (auto *var : env) {
    if (!var) {
      throw std::invalid_argument("thunk free variable is null");
    }
  }
  CodeTable::instance().add(code, env.size());
  auto *node = allocate(ClosureKind::Thunk);
  node->code = code;
  node->fields = std::move(env);
  return node;
}

auto Heap::make_cell(Closure *contents) -> Closure * {
  if (!contents) {
    throw std::invalid_argument("cell contents are null");
  }
  auto *node = allocate(ClosureKind::MutCell);
  node->indirectee.store(contents, std::memory_order_release);
  return node;
}

auto Heap::make_foreign(void *handle) -> Closure * {
  auto *node = allocate(ClosureKind::Foreign);
  node->handle = handle;
  return node;
}

auto Heap::force(Closure *node) -> Closure * {
  if (!node) {
    throw std::invalid_argument("cannot force a null closure");
  }
  for (;;) {
    node = follow(node);
    const auto kind = node->load_kind();
    if (kind != ClosureKind::Thunk && kind != ClosureKind::BlackHole) {
      return node;
    }

    std::unique_lock lock(eval_mutex_);
    switch (node->load_kind()) {
      case ClosureKind::Thunk:
        node->owner = std::this_thread::get_id();
        node->kind.store(ClosureKind::BlackHole, std::memory_order_release);
        lock.unlock();
        return evaluate(node);
      case ClosureKind::BlackHole:
        if (node->owner == std::this_thread::get_id()) {
          throw std::logic_error("<<loop>>: thunk re-entered by its evaluating thread");
        }
        eval_cv_.wait(lock, [node] {
          return node->load_kind() != ClosureKind::BlackHole;
        });
        break;
      default:
        break;
    }
  }
}

auto Heap::evaluate(Closure *thunk) -> Closure * {
  Closure *result = nullptr;
  try {
    result = force(thunk->code(*this, thunk->fields));
  } catch (...) {
    {
      std::lock_guard lock(eval_mutex_);
      thunk->owner = {};
      thunk->kind.store(ClosureKind::Thunk, std::memory_order_release);
    }
    eval_cv_.notify_all();
    throw;
  }

  {
    std::lock_guard lock(eval_mutex_);
    thunk->indirectee.store(result, std::memory_order_release);
    thunk->owner = {};
    thunk->kind.store(ClosureKind::Indirection, std::memory_order_release);
  }
  eval_cv_.notify_all();
  return result;
}

auto Heap::adopt(std::vector<std::unique_ptr<Closure>> closures) -> void {
  std::lock_guard lock(alloc_mutex_);
  log::trace("heap adopts {} closures", closures.size());
  closures_.reserve(closures_.size() + closures.size());
  for (auto &node : closures) {
    closures_.push_back(std::move(node));
  }
}

auto Heap::size() const -> std::size_t {
  std::lock_guard lock(alloc_mutex_);
  return closures_.size();
}

} // namespace gp::heap
