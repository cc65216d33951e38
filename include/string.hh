#ifndef LEXCMP_STRING_HH
#define LEXCMP_STRING_HH

#include <string>
#include <cstring>
#include <string_view>
#include <type_traits>

namespace lexcmp {

[[nodiscard]]
inline std::string cat() noexcept { return { }; }
[[nodiscard]]
inline std::string cat(std::string x) noexcept { return x; }
[[nodiscard]]
inline std::string cat(const char* x) noexcept { return x; }
[[nodiscard]]
inline std::string cat(char x) noexcept { return std::string(1,x); }
[[nodiscard]]
inline std::string cat(std::string_view x) noexcept { return std::string(x); }

template <typename... T>
[[nodiscard]]
[[gnu::always_inline]]
inline auto cat(T... x) -> std::enable_if_t<
  (sizeof...(T) > 1) && (std::is_same_v<T,std::string_view> && ...),
  std::string
> {
  std::string s;
  s.reserve((x.size() + ...));
  (s += ... += x);
  return s;
}

namespace impl {

inline std::string_view to_string_view(std::string_view x) noexcept {
  return x;
}
inline std::string_view to_string_view(const char& x) noexcept {
  return { &x, 1 };
}

}

template <typename... T>
[[nodiscard]]
[[gnu::always_inline]]
inline auto cat(const T&... x) -> std::enable_if_t<
  (sizeof...(T) > 1) && !(std::is_same_v<T,std::string_view> && ...),
  std::string
> {
  return cat(impl::to_string_view(x)...);
}

// split on '\n', dropping the empty piece after a final newline
template <typename F>
void for_each_line(std::string_view s, F&& f) {
  while (!s.empty()) {
    const auto n = s.find('\n');
    if (n == std::string_view::npos) {
      f(s);
      break;
    }
    f(s.substr(0,n));
    s.remove_prefix(n+1);
  }
}

} // end namespace lexcmp

#endif
