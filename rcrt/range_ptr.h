#ifndef RCRT_RANGE_PTR_H
#define RCRT_RANGE_PTR_H

#include <cstddef>

#include "etl/data/range_ptr.h"

#include "rcrt/panic.h"

namespace rcrt {

/*
 * Range access checking policy for RangePtrs over ELF metadata and the
 * initial stack.  Callers validate counts before indexing, so any failure
 * here is a bug, and panics.
 */
struct PanicRangeCheckPolicy {
  static constexpr std::size_t check_index(std::size_t index,
      std::size_t count) {
    return PANIC_UNLESS(index < count, bad_range_access,
                        "index out of range"), index;
  }

  static constexpr std::size_t check_slice_start(std::size_t start,
      std::size_t end,
      std::size_t count) {
    return PANIC_UNLESS(start <= count, bad_range_access,
                        "slice start out of range"), start;
  }

  static constexpr std::size_t check_slice_end(std::size_t start,
      std::size_t end,
      std::size_t count) {
    return PANIC_UNLESS(start <= end && end <= count, bad_range_access,
                        "slice end out of range"),
           end - start;
  }
};

#ifdef DISABLE_RCRT_CONSISTENCY_CHECKS
  using StartupRangeCheckPolicy = etl::data::LaxRangeCheckPolicy;
#else
  using StartupRangeCheckPolicy = PanicRangeCheckPolicy;
#endif

template <typename T>
using RangePtr = etl::data::RangePtr<T, StartupRangeCheckPolicy>;

}  // namespace rcrt

#endif  // RCRT_RANGE_PTR_H
