#ifndef RCRT_STARTUP_H
#define RCRT_STARTUP_H

/*
 * RCRT_STARTUP(entry) defines the program's true entry point, _start, for a
 * self-relocating static PIE:
 *
 *    static void my_main(int argc, char ** argv, char ** envp) { ... }
 *    RCRT_STARTUP(my_main)
 *
 * _start is naked.  It sets up no frame and touches no memory: it copies the
 * incoming stack pointer into the first argument register, computes the
 * runtime address of _DYNAMIC with instruction-relative addressing, and calls
 * rcrt::start via a C-linkage shim.  The call (rather than a jump) leaves the
 * stack aligned the way the ABI expects at function entry; nothing returns to
 * it.
 *
 * Use it in exactly one translation unit, and link with
 *    -static-pie -nostartfiles
 * compiling everything that runs before relocation with -fPIE and without
 * jump tables or stack protection.
 */

#include <cstdint>

#include "etl/attribute_macros.h"

#include "rcrt/start.h"

#if defined(__x86_64__)

  #define RCRT_ENTRY_SEQUENCE(__target) \
    "mov %rsp, %rdi\n" \
    "lea _DYNAMIC(%rip), %rsi\n" \
    "call " __target "\n" \
    "ud2\n"

#elif defined(__aarch64__)

  #define RCRT_ENTRY_SEQUENCE(__target) \
    "mov x0, sp\n" \
    "adrp x1, _DYNAMIC\n" \
    "add x1, x1, :lo12:_DYNAMIC\n" \
    "bl " __target "\n" \
    "brk #0\n"

#else
  #error "RCRT_STARTUP has no entry sequence for this target"
#endif

#define RCRT_STARTUP(__entry) \
  extern "C" __attribute__((noreturn, visibility("hidden"))) ETL_USED \
  void rcrt_start_shim(uintptr_t * sp, uintptr_t dynamic) { \
    ::rcrt::start(sp, dynamic, (__entry)); \
  } \
  \
  extern "C" ETL_NAKED ETL_USED \
  void _start() { \
    asm volatile (RCRT_ENTRY_SEQUENCE("rcrt_start_shim")); \
  }

#endif  // RCRT_STARTUP_H
