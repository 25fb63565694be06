#include "heap/code_table.hpp"

#include <mutex>
#include <stdexcept>

#include <fmt/format.h>

namespace gp::heap {
namespace {

// Reference point for code offsets. Never called.
auto code_anchor(Heap &, std::span<Closure *const>) -> Closure * {
  return nullptr;
}

auto address_of(ThunkCode code) -> packing::Word {
  return reinterpret_cast<packing::Word>(code);
}

} // namespace

auto CodeTable::instance() -> CodeTable & {
  static CodeTable table;
  return table;
}

auto CodeTable::add(ThunkCode code, std::size_t arity) -> void {
  const auto offset = offset_of(code);
  std::unique_lock lock(mutex_);
  auto [it, inserted] = entries_.emplace(offset, Entry{code, arity});
  if (!inserted && it->second.arity != arity) {
    throw std::invalid_argument(
        fmt::format("thunk code at offset {:#x} takes {} free variables, not {}", offset,
                    it->second.arity, arity));
  }
}

auto CodeTable::contains(ThunkCode code) const -> bool {
  std::shared_lock lock(mutex_);
  return entries_.contains(offset_of(code));
}

auto CodeTable::size() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

auto CodeTable::offset_of(ThunkCode code) -> packing::Word {
  return address_of(code) - address_of(&code_anchor);
}

auto CodeTable::find(packing::Word offset) const -> std::optional<Entry> {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(offset);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace gp::heap
