#ifndef LEXCMP_UTF8_HH
#define LEXCMP_UTF8_HH

#include <cstddef>
#include <string>
#include <string_view>

namespace lexcmp::utf8 {

inline constexpr char32_t replacement = U'\uFFFD';

// Decode one scalar at p and advance p past it.
// Malformed input consumes a single byte and yields U+FFFD.
[[gnu::always_inline]]
inline char32_t decode(const char*& p, const char* const end) noexcept {
  const auto b0 = static_cast<unsigned char>(*p++);
  if (b0 < 0x80) return b0;

  unsigned n;
  char32_t c, min;
  if      ((b0 & 0xE0) == 0xC0) { n = 1; c = b0 & 0x1F; min = 0x80; }
  else if ((b0 & 0xF0) == 0xE0) { n = 2; c = b0 & 0x0F; min = 0x800; }
  else if ((b0 & 0xF8) == 0xF0) { n = 3; c = b0 & 0x07; min = 0x10000; }
  else return replacement;

  if (end - p < static_cast<std::ptrdiff_t>(n)) return replacement;
  for (unsigned i=0; i<n; ++i) {
    const auto b = static_cast<unsigned char>(p[i]);
    if ((b & 0xC0) != 0x80) return replacement;
    c = (c << 6) | (b & 0x3F);
  }
  if (c < min || c > 0x10FFFF || (0xD800 <= c && c <= 0xDFFF))
    return replacement;

  p += n;
  return c;
}

void encode(char32_t c, std::string& out);

} // end namespace lexcmp::utf8

namespace lexcmp {

// Lazy sequence of the scalar values of a borrowed string.
template <typename CharT> class scalars;

template <>
class scalars<char> {
  const char* p;
  const char* end;
public:
  explicit scalars(std::string_view s) noexcept
  : p(s.data()), end(s.data() + s.size()) { }
  bool empty() const noexcept { return p == end; }
  char32_t next() noexcept { return utf8::decode(p,end); }
};

template <>
class scalars<char32_t> {
  const char32_t* p;
  const char32_t* end;
public:
  explicit scalars(std::u32string_view s) noexcept
  : p(s.data()), end(s.data() + s.size()) { }
  bool empty() const noexcept { return p == end; }
  char32_t next() noexcept { return *p++; }
};

} // end namespace lexcmp

#endif
