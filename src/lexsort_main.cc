#include <iostream>
#include <string>
#include <vector>

#include "lexsort.hh"
#include "debug.hh"

using namespace lexcmp;
using std::cerr;

int main(int argc, char* argv[]) try {
  const auto args = lexsort::parse_args(argc,argv);
  if (args.help) {
    lexsort::usage(std::cout,argv[0]);
    return 0;
  }
  TEST(args.opt)

  std::vector<std::string> texts;
  if (args.inputs.empty()) texts.push_back(lexsort::read_input("-"));
  for (const char* name : args.inputs)
    texts.push_back(lexsort::read_input(name));

  lexsort::write_output(args,lexsort::process(args,std::move(texts)));
} catch (const lexsort::usage_error& e) {
  cerr << "\033[31;1m" << e.what() << "\033[0m" << std::endl;
  lexsort::usage(cerr,argv[0]);
  return 1;
} catch (const std::exception& e) {
  cerr << "\033[31;1m" << e.what() << "\033[0m" << std::endl;
  return 1;
}
