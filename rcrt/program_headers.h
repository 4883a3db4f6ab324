#ifndef RCRT_PROGRAM_HEADERS_H
#define RCRT_PROGRAM_HEADERS_H

/*
 * Program Header Scanner.  Finds the facts the rest of startup needs in the
 * image's own program header table, in a single pass.
 */

#include <cstddef>

#include "rcrt/address_space.h"
#include "rcrt/maybe.h"
#include "rcrt/types.h"

namespace rcrt {

/*
 * What the program headers say about the image.  All addresses are
 * link-time addresses; add the load bias to find them in memory.
 */
struct ImageLayout {
  // The PT_DYNAMIC segment.
  Address dynamic_vaddr;
  std::size_t dynamic_size;

  // Link-time address of the program header table itself, from PT_PHDR.
  // Absent in images linked without one.
  Maybe<Address> phdr_vaddr;

  // Extent of the PT_LOAD segments: [load_begin, load_end).
  Address load_begin;
  Address load_end;
};

/*
 * Scans 'count' program headers, each 'entry_size' bytes, found in 'table'
 * starting at its first byte.
 *
 * Returns nothing if there is no PT_DYNAMIC segment, or if the PT_DYNAMIC
 * segment is not contained by the loaded extent: either way, this is not an
 * image we know how to relocate.
 *
 * Precondition: entry_size is at least sizeof(Elf64_Phdr) and 8-byte aligned,
 * and 'table' holds entry_size * count bytes.
 */
Maybe<ImageLayout> scan_program_headers(Window const & table,
                                        std::size_t entry_size,
                                        std::size_t count);

}  // namespace rcrt

#endif  // RCRT_PROGRAM_HEADERS_H
