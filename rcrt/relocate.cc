#include "rcrt/relocate.h"

#include <elf.h>

#include "rcrt/arch.h"
#include "rcrt/panic.h"

namespace rcrt {

static bool is_relative(Elf64_Xword info) {
  return ELF64_R_TYPE(info) == arch::relative_relocation_type;
}

/*
 * The two entry forms differ only in where the addend comes from, so the
 * passes are written once over the entry type.
 */
static Maybe<Word> addend_of(Window const &, Elf64_Rela const & entry,
                             Address) {
  return Word(entry.r_addend);
}

static Maybe<Word> addend_of(Window const & image, Elf64_Rel const &,
                             Address target) {
  return image.load<Word>(target);
}

template <typename Entry>
static Maybe<RelocationCount> apply_table(Window const & image,
                                          Window const & table,
                                          RangePtr<Entry const> entries,
                                          LoadBias bias,
                                          OnUnsupported on_unsupported) {
  RelocationCount count{0, 0};

  // Check everything first, so that a bad table leaves the image untouched.
  for (auto const & entry : entries) {
    if (!is_relative(entry.r_info)) {
      ALWAYS_PANIC_IF(on_unsupported == OnUnsupported::reject,
                      unsupported_relocation_type,
                      "non-relative relocation in self-relocating image");
      ++count.skipped;
      continue;
    }

    auto target = rebase(entry.r_offset, bias);
    if (!image.load<Word>(target)) return nothing;
    // A write into the table would change entries not yet applied.  Both
    // are 8-byte aligned, so any overlap means containment.
    if (table.contains(target, sizeof(Word))) return nothing;
    ++count.applied;
  }

  for (auto const & entry : entries) {
    if (!is_relative(entry.r_info)) continue;

    auto target = rebase(entry.r_offset, bias);
    auto addend = addend_of(image, entry, target);
    ALWAYS_PANIC_UNLESS(addend, relocation_out_of_bounds,
                        "relocation target unreadable");
    bool stored = image.store<Word>(target, Word(bias) + addend.const_ref());
    ALWAYS_PANIC_UNLESS(stored, relocation_out_of_bounds,
                        "relocation target unwritable");
  }

  return count;
}

Maybe<RelocationCount> apply_relocations(Window const & image,
                                         RelocationTable const & table,
                                         LoadBias bias,
                                         OnUnsupported on_unsupported) {
  switch (table.form) {
    case RelocationForm::rela:
      {
        auto entries = image.array<Elf64_Rela>(table.address, table.count);
        if (!entries) return nothing;
        auto extent = image.sub(table.address,
                                table.count * sizeof(Elf64_Rela));
        if (!extent) return nothing;
        return apply_table(image, extent.const_ref(), entries.const_ref(),
                           bias, on_unsupported);
      }

    case RelocationForm::rel:
      {
        auto entries = image.array<Elf64_Rel>(table.address, table.count);
        if (!entries) return nothing;
        auto extent = image.sub(table.address,
                                table.count * sizeof(Elf64_Rel));
        if (!extent) return nothing;
        return apply_table(image, extent.const_ref(), entries.const_ref(),
                           bias, on_unsupported);
      }
  }

  return nothing;
}

}  // namespace rcrt
