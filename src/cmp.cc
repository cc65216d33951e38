#include "cmp.hh"
#include "translit_stream.hh"

namespace lexcmp {
namespace {

using std::strong_ordering;

template <typename CharT>
using stream = translit_stream<CharT>;

template <typename CharT>
strong_ordering lexicographic(stream<CharT> a, stream<CharT> b) noexcept {
  for (;; ++a, ++b) {
    if (a.at_end()) return b.at_end()
      ? strong_ordering::equal : strong_ordering::less;
    if (b.at_end()) return strong_ordering::greater;
    if (*a != *b) return *a <=> *b;
  }
}

// Digit runs are compared by value without being converted:
// leading zeros are skipped, the longer run is greater,
// and runs of equal length are decided by their first differing digit.
template <typename CharT>
strong_ordering numbers(stream<CharT>& a, stream<CharT>& b) noexcept {
  while (!a.at_end() && *a == U'0') ++a;
  while (!b.at_end() && *b == U'0') ++b;

  auto ord = strong_ordering::equal;
  for (;; ++a, ++b) {
    const bool ea = a.at_end() || !is_digit(*a);
    const bool eb = b.at_end() || !is_digit(*b);
    if (ea || eb) {
      if (ea != eb) return ea ? strong_ordering::less : strong_ordering::greater;
      return ord;
    }
    if (ord == 0) ord = *a <=> *b;
  }
}

template <typename CharT>
strong_ordering words(
  stream<CharT>& a, stream<CharT>& b, bool split
) noexcept {
  const auto ends = [split](const stream<CharT>& s){
    return s.at_end() || is_digit(*s) || (split && is_separator(*s));
  };
  for (;; ++a, ++b) {
    const bool ea = ends(a), eb = ends(b);
    if (ea || eb) {
      if (ea != eb) return ea ? strong_ordering::less : strong_ordering::greater;
      return strong_ordering::equal;
    }
    if (*a != *b) return *a <=> *b;
  }
}

// Token by token. When one side starts a digit run and the other does not,
// the digit run ranks like its first digit: after ASCII punctuation
// below '0' and before letters.
template <typename CharT>
strong_ordering natural(stream<CharT> a, stream<CharT> b, bool split) noexcept {
  for (;;) {
    if (split) {
      while (!a.at_end() && is_separator(*a)) ++a;
      while (!b.at_end() && is_separator(*b)) ++b;
    }
    if (a.at_end()) return b.at_end()
      ? strong_ordering::equal : strong_ordering::less;
    if (b.at_end()) return strong_ordering::greater;

    const bool da = is_digit(*a), db = is_digit(*b);
    if (da != db) return *a <=> *b;

    if (const auto ord = da ? numbers(a,b) : words(a,b,split); ord != 0)
      return ord;
  }
}

template <typename CharT>
strong_ordering folded(
  std::basic_string_view<CharT> a, std::basic_string_view<CharT> b,
  const options& opt
) noexcept {
  if (opt.ordering == ordering_mode::natural)
    return natural<CharT>(
      { a, opt, false }, { b, opt, false }, opt.only_alnum);
  else
    return lexicographic<CharT>(
      { a, opt, opt.only_alnum }, { b, opt, opt.only_alnum });
}

template <typename CharT>
strong_ordering total(
  std::basic_string_view<CharT> a, std::basic_string_view<CharT> b,
  const options& opt
) noexcept {
  if (a == b) return strong_ordering::equal;
  if (const auto ord = folded(a,b,opt); ord != 0) return ord;
  return a <=> b;
}

}

strong_ordering compare(
  std::string_view a, std::string_view b, const options& opt
) noexcept {
  return total(a,b,opt);
}
strong_ordering compare(
  std::u32string_view a, std::u32string_view b, const options& opt
) noexcept {
  return total(a,b,opt);
}

std::weak_ordering weak_compare(
  std::string_view a, std::string_view b, const options& opt
) noexcept {
  return folded(a,b,opt);
}
std::weak_ordering weak_compare(
  std::u32string_view a, std::u32string_view b, const options& opt
) noexcept {
  return folded(a,b,opt);
}

} // end namespace lexcmp
