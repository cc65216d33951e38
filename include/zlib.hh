#ifndef LEXCMP_ZLIB_HH
#define LEXCMP_ZLIB_HH

#include <string>
#include <string_view>

namespace lexcmp::zlib {

std::string deflate(std::string_view in, bool gz = true);

// accepts both gzip and zlib streams
std::string inflate(std::string_view in);

[[nodiscard]]
inline bool is_gzip(std::string_view s) noexcept {
  return s.size() >= 2 && s[0] == '\x1F' && s[1] == '\x8B';
}

}

#endif
