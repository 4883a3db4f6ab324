/*
 * A static PIE that relocates itself with rcrt, then checks that pointers
 * stored in its data segment were rebased.  Exits 0 on success, 1 if any
 * pointer is wrong.
 *
 * The checks here depend on the image actually being loaded away from its
 * link-time address, which the kernel does for every static PIE.
 */

#include <cstdint>

#include "rcrt/startup.h"

int add_one(int x) { return x + 1; }
int twice(int x) { return 2 * x; }

// Data that the linker can only express as relative relocations.  External
// linkage keeps the compiler from folding the loads away.
char const * greeting = "hello from a relocated image";

int (*operations[])(int) = {
  add_one,
  twice,
};

int counter = 3;
int * counter_ptr = &counter;

namespace {

__attribute__((noreturn))
void exit_process(int status) {
#if defined(__x86_64__)
  asm volatile ("syscall" :: "a"(231), "D"(status) : "rcx", "r11", "memory");
#elif defined(__aarch64__)
  register long x8 asm("x8") = 94;
  register long x0 asm("x0") = status;
  asm volatile ("svc #0" :: "r"(x8), "r"(x0) : "memory");
#endif
  __builtin_trap();
}

bool pointers_rebased() {
  if (greeting[0] != 'h') return false;
  if (operations[0](1) != 2) return false;
  if (operations[1](5) != 10) return false;
  if (counter_ptr != &counter || *counter_ptr != 3) return false;
  return true;
}

void selftest_main(int argc, char ** argv, char ** envp) {
  (void) envp;
  if (argc < 1 || argv[0] == nullptr) exit_process(1);
  exit_process(pointers_rebased() ? 0 : 1);
}

}  // namespace

RCRT_STARTUP(selftest_main)
