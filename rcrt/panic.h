#ifndef RCRT_PANIC_H
#define RCRT_PANIC_H

/*
 * PANIC and friends end the process when startup cannot continue.  There is
 * nobody to report an error to this early: addressing may not be valid yet,
 * and no user code has run.  Every failure during startup is therefore fatal,
 * and identified by a Fault code.
 *
 * The PANIC_IF/PANIC_UNLESS macros are for internal consistency checks and
 * can be "disarmed" by defining DISABLE_RCRT_CONSISTENCY_CHECKS.
 */

#include <cstdint>

namespace rcrt {

enum class Fault : uint8_t {
  // No PT_DYNAMIC in the program header table; not a supported static PIE.
  missing_dynamic_segment = 1,
  // Relocation tags in the dynamic section are absent, duplicated, or
  // inconsistent.
  malformed_dynamic_section,
  // A relocation other than the relative kind, when those are rejected.
  unsupported_relocation_type,
  // The initial stack image lacks a terminator or a required aux tag.
  stack_layout_violation,
  // A relocation table or target lies outside the loaded image.
  relocation_out_of_bounds,
  // Neither PT_PHDR nor a _DYNAMIC anchor was available.
  unknown_load_bias,
  // Self-relocation was entered a second time.
  already_relocated,
  // The user's entry function returned.
  entry_returned,
  // A bounds-checked view was misused.
  bad_range_access,
};

/*
 * Implementation of the PANIC macro.
 */
__attribute__((noreturn))
void panic(Fault, char const * reason);

}  // namespace rcrt

/*
 * PANIC ends the process with the given Fault.  It cannot be disabled.
 */
#define PANIC(__fault, __reason) \
  ::rcrt::panic(::rcrt::Fault::__fault, __reason)

/*
 * Checks if a condition is true and panics if so.  Not intended to be
 * disabled; used to validate the image and stack at startup.
 */
#define ALWAYS_PANIC_IF(__condition, __fault, __reason) \
  ((__condition) ? PANIC(__fault, __reason) : void(0))

/*
 * Checks if a condition is true, and panics otherwise.
 */
#define ALWAYS_PANIC_UNLESS(__condition, __fault, __reason) \
  ((__condition) ? void(0) : PANIC(__fault, __reason))

#ifndef DISABLE_RCRT_CONSISTENCY_CHECKS

  #define PANIC_UNLESS ALWAYS_PANIC_UNLESS
  #define PANIC_IF ALWAYS_PANIC_IF

#else  // defined(DISABLE_RCRT_CONSISTENCY_CHECKS)

  #define PANIC_UNLESS(__c, __f, __r) ((void) 0)
  #define PANIC_IF(__c, __f, __r) ((void) 0)

#endif

#endif  // RCRT_PANIC_H
