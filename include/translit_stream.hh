#ifndef LEXCMP_TRANSLIT_STREAM_HH
#define LEXCMP_TRANSLIT_STREAM_HH

#include <string_view>

#include "options.hh"
#include "translit.hh"
#include "utf8.hh"

namespace lexcmp {

[[gnu::const]]
constexpr bool is_digit(char32_t c) noexcept {
  return U'0' <= c && c <= U'9';
}

[[gnu::const]]
constexpr bool is_separator(char32_t c) noexcept {
  return c < 0x80 && !( is_digit(c)
    || (U'A' <= c && c <= U'Z') || (U'a' <= c && c <= U'z') );
}

// Lazily yields the scalars of a string after transliteration and
// case folding, expanding one input character into several as needed.
// Holds one character of lookahead; nothing is allocated.
template <typename CharT>
class translit_stream {
  scalars<CharT> src;
  std::string_view pending; // rest of the current expansion
  char32_t c = 0;
  bool has = false;
  const bool translit_on, fold, drop_separators;

  void advance() noexcept {
    for (;;) {
      if (!pending.empty()) {
        c = static_cast<unsigned char>(pending.front());
        pending.remove_prefix(1);
      } else if (src.empty()) {
        has = false;
        return;
      } else {
        c = src.next();
        if (translit_on && c >= 0x80) {
          if (const auto s = translit(c); !s.empty()) {
            c = static_cast<unsigned char>(s.front());
            pending = s.substr(1);
          }
        }
      }
      if (fold && U'A' <= c && c <= U'Z') c += U'a' - U'A';
      if (!(drop_separators && is_separator(c))) break;
    }
    has = true;
  }

public:
  translit_stream(
    std::basic_string_view<CharT> s, const options& opt,
    bool drop_separators
  ) noexcept
  : src(s),
    translit_on(opt.transliterate),
    fold(opt.letter_case == case_mode::insensitive),
    drop_separators(drop_separators)
  { advance(); }

  bool at_end() const noexcept { return !has; }
  char32_t operator*() const noexcept { return c; }
  translit_stream& operator++() noexcept { advance(); return *this; }
};

} // end namespace lexcmp

#endif
