#include <gflags/gflags.h>

DEFINE_uint64(pack_buffer_words, 1u << 20,
              "Maximum size of a packed graph in machine words (NoBuffer beyond this)");
