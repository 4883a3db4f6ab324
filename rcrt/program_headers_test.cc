#include <gtest/gtest.h>

#include <elf.h>

#include "rcrt/program_headers.h"

#include "rcrt/testutil/image_builder.h"
#include "rcrt/testutil/panic_fake.h"

namespace rcrt {

class ProgramHeadersTest : public ::testing::Test {
protected:
  static constexpr Address runtime_base = 0x555555554000;
  static constexpr Address phdr_offset = 0x40;

  ImageBuilder _image{0x1000};

  Maybe<ImageLayout> scan(std::size_t count,
                          std::size_t entry_size = sizeof(Elf64_Phdr)) {
    auto image = _image.loaded_at(runtime_base);
    auto table = image.sub(runtime_base + phdr_offset, count * entry_size);
    EXPECT_TRUE(table) << "test image too small for its headers";
    return scan_program_headers(table.const_ref(), entry_size, count);
  }
};

constexpr Address ProgramHeadersTest::runtime_base;
constexpr Address ProgramHeadersTest::phdr_offset;

TEST_F(ProgramHeadersTest, finds_dynamic) {
  _image.put_program_headers(phdr_offset, {
    program_header(PT_PHDR, phdr_offset, 4 * sizeof(Elf64_Phdr)),
    program_header(PT_LOAD, 0, 0x800),
    program_header(PT_LOAD, 0x800, 0x800),
    program_header(PT_DYNAMIC, 0x900, 0x100),
  });

  auto layout = scan(4);
  ASSERT_TRUE(layout);
  auto const & l = layout.const_ref();

  ASSERT_EQ(0x900u, l.dynamic_vaddr);
  ASSERT_EQ(0x100u, l.dynamic_size);
  ASSERT_TRUE(l.phdr_vaddr);
  ASSERT_EQ(phdr_offset, l.phdr_vaddr.const_ref());
  ASSERT_EQ(0u, l.load_begin);
  ASSERT_EQ(0x1000u, l.load_end);
}

TEST_F(ProgramHeadersTest, missing_dynamic) {
  _image.put_program_headers(phdr_offset, {
    program_header(PT_PHDR, phdr_offset, 2 * sizeof(Elf64_Phdr)),
    program_header(PT_LOAD, 0, 0x1000),
  });
  auto before = _image.snapshot();

  ASSERT_FALSE(scan(2))
    << "an image without PT_DYNAMIC is not a static PIE we can relocate";
  ASSERT_EQ(before, _image.snapshot()) << "scanning must not write";
}

TEST_F(ProgramHeadersTest, no_headers) {
  ASSERT_FALSE(scan(0));
}

TEST_F(ProgramHeadersTest, no_phdr_segment) {
  _image.put_program_headers(phdr_offset, {
    program_header(PT_LOAD, 0, 0x1000),
    program_header(PT_DYNAMIC, 0x200, 0x80),
  });

  auto layout = scan(2);
  ASSERT_TRUE(layout);
  ASSERT_FALSE(layout.const_ref().phdr_vaddr);
}

TEST_F(ProgramHeadersTest, first_dynamic_wins) {
  _image.put_program_headers(phdr_offset, {
    program_header(PT_LOAD, 0, 0x1000),
    program_header(PT_DYNAMIC, 0x200, 0x80),
    program_header(PT_DYNAMIC, 0x400, 0x80),
  });

  auto layout = scan(3);
  ASSERT_TRUE(layout);
  ASSERT_EQ(0x200u, layout.const_ref().dynamic_vaddr);
}

TEST_F(ProgramHeadersTest, dynamic_outside_loaded_image) {
  _image.put_program_headers(phdr_offset, {
    program_header(PT_LOAD, 0, 0x800),
    program_header(PT_DYNAMIC, 0x7c0, 0x80),
  });

  ASSERT_FALSE(scan(2))
    << "PT_DYNAMIC must be covered by the loaded segments";
}

TEST_F(ProgramHeadersTest, dynamic_without_load) {
  _image.put_program_headers(phdr_offset, {
    program_header(PT_DYNAMIC, 0x200, 0x80),
  });

  ASSERT_FALSE(scan(1));
}

TEST_F(ProgramHeadersTest, wrapping_load_segment) {
  _image.put_program_headers(phdr_offset, {
    program_header(PT_LOAD, 0x1000, UINT64_MAX),
    program_header(PT_DYNAMIC, 0x1000, 0x80),
  });

  ASSERT_FALSE(scan(2));
}

TEST_F(ProgramHeadersTest, honors_larger_entry_size) {
  // Entries padded to 64 bytes: the scanner must stride by the entry size
  // the OS reports, not by sizeof(Elf64_Phdr).
  constexpr std::size_t stride = 64;
  auto load = program_header(PT_LOAD, 0, 0x1000);
  auto dyn = program_header(PT_DYNAMIC, 0x300, 0x40);
  _image.put_program_headers(phdr_offset, {load});
  _image.put_program_headers(phdr_offset + stride, {dyn});

  auto layout = scan(2, stride);
  ASSERT_TRUE(layout);
  ASSERT_EQ(0x300u, layout.const_ref().dynamic_vaddr);
}

}  // namespace rcrt

int main(int argc, char * argv[]) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
