#include "heap/values.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include "heap/code_table.hpp"

namespace gp::heap {
namespace {

auto expect_int(const Closure *node) -> std::int64_t {
  if (node->load_kind() != ClosureKind::Int) {
    throw std::logic_error(fmt::format("expected an integer closure, found kind {}",
                                       static_cast<int>(node->load_kind())));
  }
  return node->value;
}

auto is_list_cell(const Closure *node) -> bool {
  if (node->load_kind() != ClosureKind::Con) {
    return false;
  }
  return (node->tag == kNilTag && node->fields.empty()) ||
         (node->tag == kConsTag && node->fields.size() == 2);
}

// Nil has no fields, Cons has head and tail.
auto expect_list_cell(const Closure *node) -> bool {
  if (!is_list_cell(node)) {
    throw std::logic_error(fmt::format("expected a list constructor, found tag {} with {} fields",
                                       node->tag, node->fields.size()));
  }
  return node->tag == kConsTag;
}

// env: [from, to]
auto enum_from_to_code(Heap &heap, std::span<Closure *const> env) -> Closure * {
  const auto from = expect_int(heap.force(env[0]));
  const auto to = expect_int(heap.force(env[1]));
  if (from > to) {
    return heap.make_con(kNilTag, {});
  }
  auto *rest = heap.make_thunk(&enum_from_to_code, {heap.make_int(from + 1), env[1]});
  return heap.make_con(kConsTag, {env[0], rest});
}

// env: [list]
auto sum_code(Heap &heap, std::span<Closure *const> env) -> Closure * {
  std::int64_t total = 0;
  auto *cell = heap.force(env[0]);
  while (expect_list_cell(cell)) {
    total += expect_int(heap.force(cell->fields[0]));
    cell = heap.force(cell->fields[1]);
  }
  return heap.make_int(total);
}

const CodeRegistrar kEnumFromToRegistrar{&enum_from_to_code, 2};
const CodeRegistrar kSumRegistrar{&sum_code, 1};

} // namespace

auto make_int(Heap &heap, std::int64_t value) -> Ref<std::int64_t> {
  return Ref<std::int64_t>(heap.make_int(value));
}

auto read_int(Heap &heap, Ref<std::int64_t> ref) -> std::int64_t {
  return expect_int(heap.force(ref.node()));
}

auto make_list(Heap &heap, std::span<const std::int64_t> values)
    -> Ref<List<std::int64_t>> {
  auto *list = heap.make_con(kNilTag, {});
  for (auto it = values.rbegin(); it != values.rend(); ++it) {
    list = heap.make_con(kConsTag, {heap.make_int(*it), list});
  }
  return Ref<List<std::int64_t>>(list);
}

auto enum_from_to(Heap &heap, std::int64_t from, std::int64_t to)
    -> Ref<List<std::int64_t>> {
  return Ref<List<std::int64_t>>(
      heap.make_thunk(&enum_from_to_code, {heap.make_int(from), heap.make_int(to)}));
}

auto lazy_sum(Heap &heap, Ref<List<std::int64_t>> list) -> Ref<std::int64_t> {
  return Ref<std::int64_t>(heap.make_thunk(&sum_code, {list.node()}));
}

auto force_prefix(Heap &heap, Ref<List<std::int64_t>> list, std::size_t n) -> void {
  if (n == 0) {
    return;
  }
  auto *cell = heap.force(list.node());
  for (std::size_t i = 0; i < n && expect_list_cell(cell); ++i) {
    heap.force(cell->fields[0]);
    if (i + 1 < n) {
      cell = heap.force(cell->fields[1]);
    }
  }
}

auto evaluated_prefix(Ref<List<std::int64_t>> list) -> std::size_t {
  std::size_t count = 0;
  const auto *cell = follow(list.node());
  while (cell && is_list_cell(cell) && cell->tag == kConsTag) {
    ++count;
    cell = follow(cell->fields[1]);
  }
  return count;
}

auto list_to_vector(Heap &heap, Ref<List<std::int64_t>> list)
    -> std::vector<std::int64_t> {
  std::vector<std::int64_t> out;
  auto *cell = heap.force(list.node());
  while (expect_list_cell(cell)) {
    out.push_back(expect_int(heap.force(cell->fields[0])));
    cell = heap.force(cell->fields[1]);
  }
  return out;
}

auto make_cell(Heap &heap, Ref<std::int64_t> contents) -> Ref<Cell<std::int64_t>> {
  return Ref<Cell<std::int64_t>>(heap.make_cell(contents.node()));
}

auto make_foreign(Heap &heap, void *handle) -> Ref<ForeignHandle> {
  return Ref<ForeignHandle>(heap.make_foreign(handle));
}

} // namespace gp::heap
