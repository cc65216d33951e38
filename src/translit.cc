#include "translit.hh"
#include "utf8.hh"

namespace lexcmp {

std::string transliterate(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (scalars<char> src(s); !src.empty(); ) {
    const char32_t c = src.next();
    if (const auto t = translit(c); !t.empty()) out += t;
    else utf8::encode(c,out);
  }
  return out;
}

}
