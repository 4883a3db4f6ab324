#ifndef RCRT_TESTUTIL_PANIC_FAKE_H
#define RCRT_TESTUTIL_PANIC_FAKE_H

/*
 * Under test, rcrt::panic throws a PanicError instead of trapping, so that
 * fatal paths can be observed.
 */

#include <ostream>
#include <stdexcept>

#include "rcrt/panic.h"

namespace rcrt {

class PanicError : public std::logic_error {
public:
  PanicError(Fault f, char const * reason)
    : std::logic_error(reason), fault{f} {}

  Fault fault;
};

std::ostream & operator<<(std::ostream &, Fault);

}  // namespace rcrt

/*
 * Runs a statement and expects it to panic with the given Fault.
 */
#define EXPECT_PANIC(__statement, __fault) \
{ \
  bool __panicked = false; \
  try { \
    __statement; \
  } catch (::rcrt::PanicError const & __e) { \
    __panicked = true; \
    EXPECT_EQ(::rcrt::Fault::__fault, __e.fault) \
      << "panicked for the wrong reason: " << __e.what(); \
  } \
  EXPECT_TRUE(__panicked) << "expected panic: " #__fault; \
}

#endif  // RCRT_TESTUTIL_PANIC_FAKE_H
