#ifndef RCRT_CONFIG_H
#define RCRT_CONFIG_H

#include <cstddef>

namespace rcrt {
namespace config {

/*
 * When set, a non-relative relocation in the image is fatal instead of being
 * skipped.  Images linked for self-relocation should contain none.
 */
static constexpr bool reject_symbolic_relocations = false;

static constexpr std::size_t
  // Upper bound on aux vector pairs examined before giving up on AT_NULL.
  max_auxv_entries = 256,
  // Upper bound on the span of stack words the trampoline may decode.
  max_stack_words = std::size_t(1) << 24;

}  // namespace config
}  // namespace rcrt

#endif  // RCRT_CONFIG_H
