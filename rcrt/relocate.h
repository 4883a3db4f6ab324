#ifndef RCRT_RELOCATE_H
#define RCRT_RELOCATE_H

/*
 * Relocation Applier.
 *
 * For each relative relocation, computes
 *
 *    *(offset + bias) = bias + addend
 *
 * where the addend is explicit in a RELA entry, and is the 8-byte value
 * already stored at the target for a REL entry.  Other relocation types need
 * a symbol table and a dynamic linker; we have neither.
 *
 * Note that this is not idempotent: a second pass with the same bias adds the
 * bias again.  Run it exactly once per image.
 */

#include <cstddef>

#include "rcrt/address_space.h"
#include "rcrt/config.h"
#include "rcrt/dynamic.h"
#include "rcrt/maybe.h"
#include "rcrt/types.h"

namespace rcrt {

/*
 * What to do on meeting a relocation that isn't the relative kind.
 */
enum class OnUnsupported {
  skip,    // leave the target alone, and count it
  reject,  // panic with Fault::unsupported_relocation_type
};

static constexpr OnUnsupported default_on_unsupported =
  config::reject_symbolic_relocations ? OnUnsupported::reject
                                      : OnUnsupported::skip;

struct RelocationCount {
  std::size_t applied;
  std::size_t skipped;
};

/*
 * Applies 'table' to 'image', in table order, visiting each entry once.
 *
 * Both the table and every relative target must lie within 'image', targets
 * must be 8-byte aligned, and no target may fall inside the table itself.  All entries are checked before anything is
 * written; if any check fails, returns nothing and 'image' is unchanged.
 *
 * With OnUnsupported::reject, a non-relative entry panics during the checking
 * phase, also before anything is written.
 */
Maybe<RelocationCount> apply_relocations(
    Window const & image,
    RelocationTable const & table,
    LoadBias bias,
    OnUnsupported on_unsupported = default_on_unsupported);

}  // namespace rcrt

#endif  // RCRT_RELOCATE_H
