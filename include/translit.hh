#ifndef LEXCMP_TRANSLIT_HH
#define LEXCMP_TRANSLIT_HH

#include <string>
#include <string_view>

namespace lexcmp {

// ASCII spelling of c. ASCII maps to itself.
// An empty view means there is no entry and c stands for itself.
[[nodiscard]]
std::string_view translit(char32_t c) noexcept;

// UTF-8 rendering of the transliterated string, for display.
// Characters without an entry are copied unchanged.
[[nodiscard]]
std::string transliterate(std::string_view s);

}

#endif
