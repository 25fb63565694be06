#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "heap/heap.hpp"
#include "heap/ref.hpp"

namespace gp::heap {

inline constexpr std::uint32_t kNilTag = 0;
inline constexpr std::uint32_t kConsTag = 1;

auto make_int(Heap &heap, std::int64_t value) -> Ref<std::int64_t>;

/// Forces the reference. Throws std::logic_error if it is not an integer.
auto read_int(Heap &heap, Ref<std::int64_t> ref) -> std::int64_t;

auto make_list(Heap &heap, std::span<const std::int64_t> values)
    -> Ref<List<std::int64_t>>;

/// Lazy [from..to]: each tail is a thunk evaluated on demand.
auto enum_from_to(Heap &heap, std::int64_t from, std::int64_t to)
    -> Ref<List<std::int64_t>>;

/// Suspended sum of a list.
auto lazy_sum(Heap &heap, Ref<List<std::int64_t>> list) -> Ref<std::int64_t>;

/// Force the spine and elements of the first n cells (or fewer).
auto force_prefix(Heap &heap, Ref<List<std::int64_t>> list, std::size_t n) -> void;

/// Number of leading cons cells already evaluated; forces nothing.
auto evaluated_prefix(Ref<List<std::int64_t>> list) -> std::size_t;

/// Force the whole list and collect its elements.
auto list_to_vector(Heap &heap, Ref<List<std::int64_t>> list)
    -> std::vector<std::int64_t>;

auto make_cell(Heap &heap, Ref<std::int64_t> contents) -> Ref<Cell<std::int64_t>>;

auto make_foreign(Heap &heap, void *handle) -> Ref<ForeignHandle>;

} // namespace gp::heap
