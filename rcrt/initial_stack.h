#ifndef RCRT_INITIAL_STACK_H
#define RCRT_INITIAL_STACK_H

/*
 * Decoding of the initial stack image, as deposited by the OS at process
 * entry:
 *
 *    sp -> argc
 *          argv[0] ... argv[argc - 1], 0
 *          envp[0] ... , 0
 *          auxv tag, value ... , AT_NULL
 *
 * Every word is a uintptr_t.  The stack is only ever read through a RangePtr
 * whose bounds the caller chooses, and decoding fails rather than reading past
 * them.
 */

#include <cstddef>
#include <cstdint>

#include "rcrt/maybe.h"
#include "rcrt/range_ptr.h"
#include "rcrt/types.h"

namespace rcrt {

struct InitialStack {
  int argc;
  char ** argv;
  char ** envp;
  // Aux vector tag/value pairs, not including the AT_NULL terminator.
  RangePtr<uintptr_t> auxv;
};

/*
 * Decodes argc, argv, envp and auxv from 'words'.  Returns nothing if any
 * terminator is missing within 'words', or if argc is implausible.
 */
Maybe<InitialStack> decode_initial_stack(RangePtr<uintptr_t> words);

/*
 * Finds the value of the first aux vector entry with the given tag.
 */
Maybe<uintptr_t> find_aux(RangePtr<uintptr_t> auxv, uintptr_t tag);

/*
 * Where the OS says the program header table is.
 */
struct ProgramHeaderLocation {
  Address address;         // AT_PHDR
  std::size_t entry_size;  // AT_PHENT, or sizeof(Elf64_Phdr) if absent
  std::size_t count;       // AT_PHNUM
};

/*
 * Extracts the program header location from the aux vector.  Returns nothing
 * if AT_PHDR or AT_PHNUM is missing, or if AT_PHENT gives an entry size that
 * cannot hold an Elf64_Phdr at natural alignment.
 */
Maybe<ProgramHeaderLocation> find_program_headers(RangePtr<uintptr_t> auxv);

}  // namespace rcrt

#endif  // RCRT_INITIAL_STACK_H
