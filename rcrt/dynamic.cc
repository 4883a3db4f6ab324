#include "rcrt/dynamic.h"

#include <elf.h>

namespace rcrt {

/*
 * Records a tag's value, refusing a second occurrence.
 */
static bool record(Maybe<uint64_t> & slot, uint64_t value) {
  if (slot) return false;
  slot = value;
  return true;
}

/*
 * Checks the size tags of one relocation form and computes its entry count.
 */
static Maybe<std::size_t> entry_count(Maybe<uint64_t> const & size,
                                      Maybe<uint64_t> const & entry_size,
                                      std::size_t layout_size) {
  if (!size) return nothing;

  if (entry_size && entry_size.const_ref() != layout_size) return nothing;

  if (size.const_ref() % layout_size) return nothing;
  return std::size_t(size.const_ref() / layout_size);
}

Maybe<RelocationTable> interpret_dynamic_section(Window const & dynamic,
                                                 LoadBias bias) {
  Maybe<uint64_t> rel{nothing}, relsz{nothing}, relent{nothing};
  Maybe<uint64_t> rela{nothing}, relasz{nothing}, relaent{nothing};
  bool terminated = false;

  auto n = dynamic.size() / sizeof(Elf64_Dyn);
  for (std::size_t i = 0; i < n && !terminated; ++i) {
    auto maybe_dyn =
      dynamic.load<Elf64_Dyn>(dynamic.address() + i * sizeof(Elf64_Dyn));
    if (!maybe_dyn) return nothing;
    auto const & dyn = maybe_dyn.const_ref();

    bool ok = true;
    switch (dyn.d_tag) {
      case DT_NULL:    terminated = true; break;
      case DT_REL:     ok = record(rel, dyn.d_un.d_ptr); break;
      case DT_RELSZ:   ok = record(relsz, dyn.d_un.d_val); break;
      case DT_RELENT:  ok = record(relent, dyn.d_un.d_val); break;
      case DT_RELA:    ok = record(rela, dyn.d_un.d_ptr); break;
      case DT_RELASZ:  ok = record(relasz, dyn.d_un.d_val); break;
      case DT_RELAENT: ok = record(relaent, dyn.d_un.d_val); break;
      default:         break;  // not our business
    }
    if (!ok) return nothing;
  }

  if (!terminated) return nothing;

  // Exactly one of the two forms.
  if (bool(rel) == bool(rela)) return nothing;

  if (rela) {
    auto count = entry_count(relasz, relaent, sizeof(Elf64_Rela));
    if (!count) return nothing;
    return RelocationTable{
      rebase(rela.const_ref(), bias),
      count.const_ref(),
      RelocationForm::rela,
    };
  } else {
    auto count = entry_count(relsz, relent, sizeof(Elf64_Rel));
    if (!count) return nothing;
    return RelocationTable{
      rebase(rel.const_ref(), bias),
      count.const_ref(),
      RelocationForm::rel,
    };
  }
}

}  // namespace rcrt
