#ifndef LEXCMP_OPTIONS_HH
#define LEXCMP_OPTIONS_HH

namespace lexcmp {

enum class ordering_mode : unsigned char { lexicographic, natural };
enum class case_mode : unsigned char { sensitive, insensitive };

struct options {
  ordering_mode ordering = ordering_mode::lexicographic;
  case_mode letter_case = case_mode::sensitive;
  // fold non-ASCII characters to their closest ASCII spelling
  bool transliterate = true;
  // ignore ASCII punctuation, spaces and control characters;
  // in natural ordering they still separate tokens
  bool only_alnum = false;
};

namespace opts {

inline constexpr options lexicographic {
  ordering_mode::lexicographic, case_mode::sensitive, true, false };
inline constexpr options lexicographic_nocase {
  ordering_mode::lexicographic, case_mode::insensitive, true, false };
inline constexpr options natural {
  ordering_mode::natural, case_mode::sensitive, true, true };
inline constexpr options natural_nocase {
  ordering_mode::natural, case_mode::insensitive, true, true };

}

} // end namespace lexcmp

#endif
