#ifndef RCRT_START_H
#define RCRT_START_H

/*
 * The Entry Trampoline: the first C++ code to run in a self-relocating static
 * PIE.  It is reached from _start (see rcrt/startup.h) with the stack pointer
 * exactly as the OS left it.
 *
 * Until relocation finishes, nothing here may read a global that contains an
 * absolute address: no function pointer tables, no pointer-valued statics, no
 * switch jump tables.  Everything computed is passed explicitly, and nothing
 * survives the call into the entry function.
 */

#include <cstddef>
#include <cstdint>

#include "rcrt/address_space.h"
#include "rcrt/initial_stack.h"
#include "rcrt/maybe.h"
#include "rcrt/program_headers.h"
#include "rcrt/range_ptr.h"
#include "rcrt/relocate.h"
#include "rcrt/types.h"

namespace rcrt {

/*
 * Signature of the program's entry function.  It must not return.
 */
using EntryFunction = void (*)(int argc, char ** argv, char ** envp);

/*
 * Relocates the image described by the initial stack at 'sp', then calls
 * 'entry' with argc, argv and envp.
 *
 * 'dynamic' is the runtime address of the image's _DYNAMIC, as computed by
 * instruction-relative addressing; it is used to find the load bias when the
 * image has no PT_PHDR.  Zero means unknown.
 *
 * Any failure panics.  Never returns; if 'entry' does, so do we -- by
 * panicking.
 */
__attribute__((noreturn))
void start(uintptr_t * sp, Address dynamic, EntryFunction entry);

/*
 * As above, over an initial stack image whose extent is known.
 */
__attribute__((noreturn))
void start(RangePtr<uintptr_t> stack, Address dynamic, EntryFunction entry);

/*
 * Computes the load bias.  Prefers AT_PHDR against PT_PHDR; failing that,
 * the runtime _DYNAMIC address against PT_DYNAMIC.  Returns nothing if
 * neither pair is available.
 */
Maybe<LoadBias> compute_load_bias(ImageLayout const &,
                                  Address runtime_phdr,
                                  Address runtime_dynamic);

/*
 * Applies the relocations named by a dynamic section, given the load bias
 * and the loaded image.  Panics on any failure.
 *
 * This is the tail of start(), available separately for boot code that
 * already knows where it is.  It is not idempotent: call it once.
 */
RelocationCount relocate(Window const & image,
                         Address dynamic,
                         std::size_t dynamic_size,
                         LoadBias bias);

/*
 * The counts from start()'s relocation pass: entries applied, and entries of
 * other types skipped.  Zero until start() has relocated.
 */
RelocationCount startup_relocation_count();

/*
 * start() refuses to relocate the process a second time.  Tests that drive
 * start() repeatedly reset that here.
 */
void reset_relocation_guard_for_test();

}  // namespace rcrt

#endif  // RCRT_START_H
