#ifndef LEXCMP_SORT_HH
#define LEXCMP_SORT_HH

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <utility>

#include "cmp.hh"

namespace lexcmp {

template <typename It>
void lex_sort(It first, It last, const options& opt) {
  std::sort(first,last,less{opt});
}

// xs may be a temporary view, e.g. a std::span over the elements
template <typename T>
void lex_sort(T&& xs, const options& opt) {
  lex_sort(std::begin(xs),std::end(xs),opt);
}

template <typename T>
void lex_stable_sort(T&& xs, const options& opt) {
  std::stable_sort(std::begin(xs),std::end(xs),less{opt});
}

// proj maps an element to the text it is sorted by,
// e.g. a trimmed view or a member.
template <typename T, typename F>
void lex_sort_by(T&& xs, const options& opt, F proj) {
  std::sort(std::begin(xs),std::end(xs),
    [&](const auto& a, const auto& b){
      return compare(proj(a),proj(b),opt) < 0;
    });
}

template <typename T, typename F>
void lex_stable_sort_by(T&& xs, const options& opt, F proj) {
  std::stable_sort(std::begin(xs),std::end(xs),
    [&](const auto& a, const auto& b){
      return compare(proj(a),proj(b),opt) < 0;
    });
}

inline const std::filesystem::path::string_type&
path_text(const std::filesystem::path& p) noexcept { return p.native(); }

template <typename T>
void path_sort(T&& paths, const options& opt) {
  lex_sort_by(std::forward<T>(paths),opt,path_text);
}

template <typename T>
void path_stable_sort(T&& paths, const options& opt) {
  lex_stable_sort_by(std::forward<T>(paths),opt,path_text);
}

} // end namespace lexcmp

#endif
