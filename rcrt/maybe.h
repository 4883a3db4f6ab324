#ifndef RCRT_MAYBE_H
#define RCRT_MAYBE_H

#include "etl/data/maybe.h"

#include "rcrt/panic.h"

namespace rcrt {

/*
 * Check policy for Maybes used during startup; converts any misuse into a
 * panic.
 */
struct PanicMaybeCheckPolicy {
  static constexpr bool check_access(bool condition) {
    return PANIC_UNLESS(condition, bad_range_access, "empty Maybe accessed"),
           true;
  }
};

template <typename T>
using Maybe = etl::data::Maybe<T, PanicMaybeCheckPolicy>;

constexpr auto nothing = etl::data::nothing;

}  // namespace rcrt

#endif  // RCRT_MAYBE_H
