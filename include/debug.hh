#ifndef LEXCMP_DEBUG_HH
#define LEXCMP_DEBUG_HH

#ifndef NDEBUG

#include <iostream>

#include "options.hh"

#define STR1(x) #x
#define STR(x) STR1(x)

#define TEST(var) std::cerr << \
  "\033[33m" STR(__LINE__) ": " \
  "\033[36m" #var ":\033[0m " << (var) << std::endl;

#ifdef LEXCMP_STRING_HH
#define INFO(color,...) std::cerr << \
  lexcmp::cat("\033[" color "m",__VA_ARGS__,"\033[0m") << std::endl;
#else
#define INFO(color,...) ;
#endif

namespace lexcmp {

inline std::ostream& operator<<(std::ostream& o, const options& opt) {
  o << (opt.ordering == ordering_mode::natural ? "natural" : "lexicographic");
  if (opt.letter_case == case_mode::insensitive) o << ",nocase";
  if (!opt.transliterate) o << ",raw";
  if (opt.only_alnum) o << ",alnum";
  return o;
}

}

#else

#define TEST(var) ;
#define INFO(color,...) ;

#endif
#endif
