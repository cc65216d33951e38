#ifndef LEXCMP_LEXSORT_HH
#define LEXCMP_LEXSORT_HH

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "options.hh"
#include "error.hh"

namespace lexcmp::lexsort {

struct settings {
  options opt;
  bool reverse = false;
  bool unique  = false;
  bool show    = false; // print transliterated lines, don't sort
  bool gz      = false;
  bool help    = false;
  const char* out_name = nullptr;
  std::vector<const char*> inputs; // empty or "-" means stdin
};

// Bad command line
struct usage_error: error {
  using error::error;
};

// getopt reorders argv
settings parse_args(int argc, char* argv[]);

void usage(std::ostream& os, const char* prog);

// Contents of a file, or of stdin for "-"
std::string read_input(const char* name);

// Sorted (or transliterated) lines of all texts, gzipped if requested.
// Compressed texts are inflated first.
std::string process(const settings& args, std::vector<std::string> texts);

void write_output(const settings& args, std::string_view out);

}

#endif
