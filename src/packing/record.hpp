#pragma once

#include <vector>

#include "packing/fingerprint.hpp"
#include "packing/graph_codec.hpp"

namespace gp::packing {

/// Logical content of an encoded packet, shared by both wire formats.
struct EncodedRecord {
  Fingerprint program;
  Fingerprint type;
  std::vector<Word> words;

  friend auto operator==(const EncodedRecord &, const EncodedRecord &) -> bool = default;
};

} // namespace gp::packing
