#include "rcrt/testutil/image_builder.h"

#include <cstring>
#include <stdexcept>

#include "rcrt/testutil/address_space_fake.h"

namespace rcrt {

ImageBuilder::ImageBuilder(std::size_t size)
  : _size{size},
    _storage((size + sizeof(uint64_t) - 1) / sizeof(uint64_t), 0) {}

uint8_t * ImageBuilder::bytes() {
  return reinterpret_cast<uint8_t *>(_storage.data());
}

std::vector<uint8_t> ImageBuilder::snapshot() const {
  auto p = reinterpret_cast<uint8_t const *>(_storage.data());
  return std::vector<uint8_t>(p, p + _size);
}

void ImageBuilder::put_bytes(Address offset, void const * data,
                             std::size_t count) {
  if (offset > _size || count > _size - offset) {
    throw std::logic_error("write outside synthetic image");
  }
  std::memcpy(bytes() + offset, data, count);
}

void ImageBuilder::put_word(Address offset, uint64_t value) {
  put_bytes(offset, &value, sizeof(value));
}

uint64_t ImageBuilder::word(Address offset) const {
  if (offset > _size || sizeof(uint64_t) > _size - offset) {
    throw std::logic_error("read outside synthetic image");
  }
  uint64_t value;
  std::memcpy(&value,
              reinterpret_cast<uint8_t const *>(_storage.data()) + offset,
              sizeof(value));
  return value;
}

void ImageBuilder::put_program_headers(Address offset,
    std::initializer_list<Elf64_Phdr> headers) {
  for (auto const & ph : headers) {
    put_bytes(offset, &ph, sizeof(ph));
    offset += sizeof(ph);
  }
}

void ImageBuilder::put_dynamic(Address offset,
    std::initializer_list<Elf64_Dyn> entries) {
  for (auto const & d : entries) {
    put_bytes(offset, &d, sizeof(d));
    offset += sizeof(d);
  }
}

void ImageBuilder::put_rela(Address offset,
    std::initializer_list<Elf64_Rela> entries) {
  for (auto const & r : entries) {
    put_bytes(offset, &r, sizeof(r));
    offset += sizeof(r);
  }
}

void ImageBuilder::put_rel(Address offset,
    std::initializer_list<Elf64_Rel> entries) {
  for (auto const & r : entries) {
    put_bytes(offset, &r, sizeof(r));
    offset += sizeof(r);
  }
}

Window ImageBuilder::loaded_at(Address runtime_base) {
  return Window{runtime_base, _size, bytes()};
}

void ImageBuilder::load_at(Address runtime_base) {
  add_fake_region(runtime_base, bytes(), _size);
}

Elf64_Phdr program_header(uint32_t type, Address vaddr, uint64_t memsz) {
  Elf64_Phdr ph;
  std::memset(&ph, 0, sizeof(ph));
  ph.p_type = type;
  ph.p_flags = PF_R;
  ph.p_offset = vaddr;
  ph.p_vaddr = vaddr;
  ph.p_paddr = vaddr;
  ph.p_filesz = memsz;
  ph.p_memsz = memsz;
  ph.p_align = 8;
  return ph;
}

Elf64_Dyn dynamic_entry(int64_t tag, uint64_t value) {
  Elf64_Dyn d;
  d.d_tag = tag;
  d.d_un.d_val = value;
  return d;
}

Elf64_Rela rela_entry(Address offset, uint32_t type, int64_t addend) {
  Elf64_Rela r;
  r.r_offset = offset;
  r.r_info = ELF64_R_INFO(0, type);
  r.r_addend = addend;
  return r;
}

Elf64_Rel rel_entry(Address offset, uint32_t type) {
  Elf64_Rel r;
  r.r_offset = offset;
  r.r_info = ELF64_R_INFO(0, type);
  return r;
}

StackBuilder & StackBuilder::arg(char const * s) {
  _args.push_back(s);
  return *this;
}

StackBuilder & StackBuilder::env(char const * s) {
  _envs.push_back(s);
  return *this;
}

StackBuilder & StackBuilder::aux(uintptr_t tag, uintptr_t value) {
  _aux.push_back(tag);
  _aux.push_back(value);
  return *this;
}

std::vector<uintptr_t> StackBuilder::build(bool terminate_auxv) const {
  std::vector<uintptr_t> words;
  words.push_back(_args.size());
  for (auto s : _args) words.push_back(reinterpret_cast<uintptr_t>(s));
  words.push_back(0);
  for (auto s : _envs) words.push_back(reinterpret_cast<uintptr_t>(s));
  words.push_back(0);
  words.insert(words.end(), _aux.begin(), _aux.end());
  if (terminate_auxv) {
    words.push_back(AT_NULL);
    words.push_back(0);
  }
  return words;
}

}  // namespace rcrt
