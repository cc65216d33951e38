#ifndef LEXCMP_CMP_HH
#define LEXCMP_CMP_HH

#include <compare>
#include <string_view>

#include "options.hh"

namespace lexcmp {

// Total order: strings equivalent after folding are ordered by their
// raw code points, so only identical strings compare equal.
[[nodiscard]]
std::strong_ordering compare(
  std::string_view a, std::string_view b, const options& opt) noexcept;
[[nodiscard]]
std::strong_ordering compare(
  std::u32string_view a, std::u32string_view b, const options& opt) noexcept;

// Folded comparison alone, without the tie-break.
// "Foo" and "fóò" are equivalent under opts::lexicographic_nocase.
[[nodiscard]]
std::weak_ordering weak_compare(
  std::string_view a, std::string_view b, const options& opt) noexcept;
[[nodiscard]]
std::weak_ordering weak_compare(
  std::u32string_view a, std::u32string_view b, const options& opt) noexcept;

[[nodiscard]] inline std::strong_ordering
lexicographic_cmp(std::string_view a, std::string_view b) noexcept {
  return compare(a,b,opts::lexicographic);
}
[[nodiscard]] inline std::strong_ordering
lexicographic_icmp(std::string_view a, std::string_view b) noexcept {
  return compare(a,b,opts::lexicographic_nocase);
}
[[nodiscard]] inline std::strong_ordering
natural_cmp(std::string_view a, std::string_view b) noexcept {
  return compare(a,b,opts::natural);
}
[[nodiscard]] inline std::strong_ordering
natural_icmp(std::string_view a, std::string_view b) noexcept {
  return compare(a,b,opts::natural_nocase);
}

// Predicate for std::sort and ordered containers
struct less {
  options opt;

  bool operator()(std::string_view a, std::string_view b) const noexcept {
    return compare(a,b,opt) < 0;
  }
  bool operator()(std::u32string_view a, std::u32string_view b) const noexcept {
    return compare(a,b,opt) < 0;
  }
};

} // end namespace lexcmp

#endif
