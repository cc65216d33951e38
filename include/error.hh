#ifndef LEXCMP_ERROR_HH
#define LEXCMP_ERROR_HH

#include <stdexcept>
#include <cerrno>
#include <utility>
#include "string.hh"

namespace lexcmp {

struct error: std::runtime_error {
  using std::runtime_error::runtime_error;
  template <typename... T> [[ gnu::always_inline ]]
  error(T&&... x): std::runtime_error(cat(std::forward<T>(x)...)) { };
  [[ gnu::always_inline ]]
  error(const char* str): std::runtime_error(str) { };
};

}

#define LEXCMP_STR1(x) #x
#define LEXCMP_STR(x) LEXCMP_STR1(x)

#define LEXCMP_ERROR_PREF __FILE__ ":" LEXCMP_STR(__LINE__) ": "

#ifdef ERROR
#error "ERROR macro already defined"
#endif
#define ERROR(...) throw lexcmp::error(LEXCMP_ERROR_PREF, __VA_ARGS__);

#ifdef THROW_ERRNO
#error "THROW_ERRNO macro already defined"
#endif
#define THROW_ERRNO(...) ERROR(__VA_ARGS__,": ",std::strerror(errno))

#endif
