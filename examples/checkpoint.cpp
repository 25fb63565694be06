#include <cstdint>
#include <exception>
#include <iostream>
#include <numeric>
#include <system_error>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "heap/heap.hpp"
#include "heap/heap_codec.hpp"
#include "heap/values.hpp"
#include "packing/executable_identity.hpp"
#include "packing/file_io.hpp"
#include "packing/serialization_service.hpp"

DEFINE_string(mode, "save", "save: checkpoint a partly evaluated list; load: resume one");
DEFINE_string(format, "binary", "Checkpoint encoding (text or binary)");
DEFINE_string(path, "checkpoint.gpk", "Checkpoint file");
DEFINE_int64(count, 10, "Length of the lazy list [1..count]");
DEFINE_int64(forced, 3, "List cells to evaluate before saving");

namespace {

using gp::heap::List;
using gp::packing::Format;

auto parse_format(const std::string &name, Format &out) -> bool {
  if (name == "text") {
    out = Format::Text;
    return true;
  }
  if (name == "binary") {
    out = Format::Binary;
    return true;
  }
  return false;
}

auto save(gp::heap::Heap &heap, gp::packing::SerializationService &service,
          Format format) -> int {
  auto list = gp::heap::enum_from_to(heap, 1, FLAGS_count);
  gp::heap::force_prefix(heap, list, static_cast<std::size_t>(FLAGS_forced));

  auto saved = gp::packing::encode_to_file(service, FLAGS_path, list, format);
  if (!saved) {
    std::cerr << "checkpoint failed: " << saved.error().message() << "\n";
    return 1;
  }
  std::cout << "saved " << FLAGS_path << " (" << gp::packing::format_name(format)
            << ", " << gp::heap::evaluated_prefix(list) << " cells evaluated)\n";
  return 0;
}

auto load(gp::heap::Heap &heap, gp::packing::SerializationService &service,
          Format format) -> int {
  auto list = gp::packing::decode_from_file<List<std::int64_t>>(service, FLAGS_path, format);
  if (!list) {
    std::cerr << "restore failed: " << list.error().message() << "\n";
    return 1;
  }
  std::cout << "restored " << FLAGS_path << " with "
            << gp::heap::evaluated_prefix(*list) << " cells already evaluated\n";
  const auto values = gp::heap::list_to_vector(heap, *list);
  std::cout << "length=" << values.size()
            << " sum=" << std::accumulate(values.begin(), values.end(), std::int64_t{0})
            << "\n";
  return 0;
}

} // namespace

auto main(int argc, char **argv) -> int {
  gflags::SetUsageMessage("checkpoint --mode=save|load [--format=text|binary] [--path=FILE]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  gp::log::init();

  Format format;
  if (!parse_format(FLAGS_format, format)) {
    std::cerr << "unknown format: " << FLAGS_format << "\n";
    return 2;
  }

  int rc = 2;
  try {
    gp::log::info("checkpoint", {{"mode", FLAGS_mode},
                                 {"format", FLAGS_format},
                                 {"program", gp::packing::to_hex(
                                                 gp::packing::ExecutableIdentity::current())}});
    gp::heap::Heap heap;
    gp::heap::HeapCodec codec(heap, gp::heap::HeapCodecConfig::from_flags());
    gp::packing::SerializationService service(codec);
    if (FLAGS_mode == "save") {
      rc = save(heap, service, format);
    } else if (FLAGS_mode == "load") {
      rc = load(heap, service, format);
    } else {
      std::cerr << "unknown mode: " << FLAGS_mode << "\n";
    }
  } catch (const std::system_error &ex) {
    std::cerr << "I/O error: " << ex.what() << "\n";
    rc = 1;
  }

  gp::log::shutdown();
  return rc;
}
