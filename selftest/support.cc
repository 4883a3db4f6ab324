/*
 * The few library routines the compiler may call on its own, for a program
 * linked without a C library.  These run before relocation too (struct copies
 * in startup code can become memcpy calls), so they must not touch globals.
 */

#include <cstddef>
#include <cstdint>

extern "C" {

void * memcpy(void * dest, void const * src, size_t n) {
  auto d = static_cast<uint8_t *>(dest);
  auto s = static_cast<uint8_t const *>(src);
  while (n--) *d++ = *s++;
  return dest;
}

void * memmove(void * dest, void const * src, size_t n) {
  auto d = static_cast<uint8_t *>(dest);
  auto s = static_cast<uint8_t const *>(src);
  if (d < s) {
    while (n--) *d++ = *s++;
  } else {
    // Copy backwards in case the ranges overlap.
    d += n;
    s += n;
    while (n--) *--d = *--s;
  }
  return dest;
}

void * memset(void * s, int c, size_t n) {
  auto p = static_cast<uint8_t *>(s);
  while (n--) *p++ = uint8_t(c);
  return s;
}

int memcmp(void const * a, void const * b, size_t n) {
  auto pa = static_cast<uint8_t const *>(a);
  auto pb = static_cast<uint8_t const *>(b);
  for (; n; --n, ++pa, ++pb) {
    if (*pa != *pb) return int(*pa) - int(*pb);
  }
  return 0;
}

}  // extern "C"
