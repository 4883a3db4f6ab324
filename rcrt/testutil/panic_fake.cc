#include "rcrt/testutil/panic_fake.h"

#include <gtest/gtest.h>

#include "etl/assert.h"

namespace rcrt {

void panic(Fault fault, char const * reason) {
  throw PanicError{fault, reason};
}

std::ostream & operator<<(std::ostream & out, Fault fault) {
  switch (fault) {
    case Fault::missing_dynamic_segment:
      return out << "missing_dynamic_segment";
    case Fault::malformed_dynamic_section:
      return out << "malformed_dynamic_section";
    case Fault::unsupported_relocation_type:
      return out << "unsupported_relocation_type";
    case Fault::stack_layout_violation:
      return out << "stack_layout_violation";
    case Fault::relocation_out_of_bounds:
      return out << "relocation_out_of_bounds";
    case Fault::unknown_load_bias:
      return out << "unknown_load_bias";
    case Fault::already_relocated:
      return out << "already_relocated";
    case Fault::entry_returned:
      return out << "entry_returned";
    case Fault::bad_range_access:
      return out << "bad_range_access";
  }
  return out << "Fault(" << unsigned(fault) << ")";
}

}  // namespace rcrt

namespace etl {

// ETL's own checks failing under test is a test failure, not a panic.
void assertion_failed(char const * file,
                      int line,
                      char const * function,
                      char const * expression) {
  ADD_FAILURE_AT(file, line) << "ETL assertion failed: " << expression;
  throw std::logic_error(expression);
}

}  // namespace etl
