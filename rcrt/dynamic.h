#ifndef RCRT_DYNAMIC_H
#define RCRT_DYNAMIC_H

/*
 * Dynamic Section Interpreter.  Reads just enough of the dynamic section to
 * locate the image's relocation table.
 */

#include <cstddef>

#include "rcrt/address_space.h"
#include "rcrt/maybe.h"
#include "rcrt/types.h"

namespace rcrt {

enum class RelocationForm {
  rel,   // Elf64_Rel: addend stored at the target
  rela,  // Elf64_Rela: explicit addend
};

/*
 * Describes a relocation table as found in memory.
 */
struct RelocationTable {
  Address address;    // runtime address of the first entry
  std::size_t count;  // number of entries
  RelocationForm form;
};

/*
 * Walks the (tag, value) pairs in 'dynamic' until DT_NULL, and derives the
 * relocation table they describe.  Table addresses in the dynamic section
 * are link-time addresses; 'bias' converts them.
 *
 * Returns nothing if:
 * - There is no DT_NULL inside 'dynamic'.
 * - Both DT_REL and DT_RELA appear, or neither does.
 * - Any relocation tag appears twice.
 * - The table address has no matching size tag.
 * - The entry size tag disagrees with the ELF64 entry layout.
 * - The table size is not a whole number of entries.
 */
Maybe<RelocationTable> interpret_dynamic_section(Window const & dynamic,
                                                 LoadBias bias);

}  // namespace rcrt

#endif  // RCRT_DYNAMIC_H
