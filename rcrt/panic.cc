#include "rcrt/panic.h"

#include "etl/assert.h"

namespace rcrt {

void panic(Fault fault, char const * reason) {
  // Keep 'fault' and 'reason' live in registers at the trap, so they can be
  // read back from a core dump or debugger.
#if defined(__x86_64__)
  asm volatile ("ud2" :: "D"(uint64_t(fault)), "S"(reason));
#elif defined(__aarch64__)
  asm volatile ("brk #0x5243" :: "r"(uint64_t(fault)), "r"(reason));
#else
  (void) fault;
  (void) reason;
#endif
  __builtin_trap();
}

}  // namespace rcrt

namespace etl {
  void assertion_failed(char const * file,
                        int line,
                        char const * function,
                        char const * expression) {
    // Parameters are named to help GDB display them.
    PANIC(bad_range_access, "assert failure in ETL");
  }
}
