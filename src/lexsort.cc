#include "lexsort.hh"

#include <iostream>
#include <algorithm>
#include <cstring>

#include <unistd.h>
#include <fcntl.h>

#include "sort.hh"
#include "translit.hh"
#include "whole_file.hh"
#include "local_fd.hh"
#include "file_desc.hh"
#include "zlib.hh"
#include "debug.hh"

namespace lexcmp::lexsort {

settings parse_args(int argc, char* argv[]) {
  settings args;
  optind = 0; // full rescan, parse_args may run more than once
  opterr = 0;
  for (int c; (c = getopt(argc,argv,":naiRrutzo:h")) != -1; ) {
    switch (c) {
      case 'n':
        args.opt.ordering = ordering_mode::natural;
        args.opt.only_alnum = true;
        break;
      case 'a': args.opt.only_alnum = true; break;
      case 'i': args.opt.letter_case = case_mode::insensitive; break;
      case 'R': args.opt.transliterate = false; break;
      case 'r': args.reverse = true; break;
      case 'u': args.unique = true; break;
      case 't': args.show = true; break;
      case 'z': args.gz = true; break;
      case 'o': args.out_name = optarg; break;
      case 'h': args.help = true; break;
      case ':':
        throw usage_error("option -",static_cast<char>(optopt),
          " requires an argument");
      default:
        throw usage_error("unknown option -",static_cast<char>(optopt));
    }
  }
  for (int i=optind; i<argc; ++i) args.inputs.push_back(argv[i]);
  return args;
}

void usage(std::ostream& os, const char* prog) {
  os << "usage: " << prog << " [-naiRrutz] [-o file] [file ...]\n"
    "  -n  natural order: numbers by value, punctuation ignored\n"
    "  -a  ignore punctuation and spaces\n"
    "  -i  ignore letter case\n"
    "  -R  compare raw characters, without transliteration\n"
    "  -r  reverse the order\n"
    "  -u  drop repeated lines\n"
    "  -t  print each line transliterated instead of sorting\n"
    "  -z  gzip the output\n"
    "  -o  write to file instead of stdout\n"
    "gzip-compressed input is decompressed automatically\n";
}

std::string read_input(const char* name) {
  if (!strcmp(name,"-")) return whole_fd(STDIN_FILENO);
  return whole_file(name);
}

std::string process(const settings& args, std::vector<std::string> texts) {
  for (auto& text : texts)
    if (zlib::is_gzip(text)) text = zlib::inflate(text);

  std::vector<std::string_view> lines;
  for (const auto& text : texts)
    for_each_line(text,[&](std::string_view line){ lines.push_back(line); });
  INFO("36","read ",std::to_string(lines.size())," lines")

  std::string out;
  if (args.show) {
    for (const auto line : lines) {
      out += transliterate(line);
      out += '\n';
    }
  } else {
    lex_sort(lines,args.opt);
    if (args.unique)
      lines.erase(std::unique(lines.begin(),lines.end()),lines.end());
    if (args.reverse)
      std::reverse(lines.begin(),lines.end());
    for (const auto line : lines) {
      out += line;
      out += '\n';
    }
  }

  if (args.gz) out = zlib::deflate(out);
  return out;
}

void write_output(const settings& args, std::string_view out) {
  if (args.out_name) {
    const local_fd fd(args.out_name,O_WRONLY|O_CREAT|O_TRUNC);
    file_desc(fd) << out;
  } else {
    file_desc(STDOUT_FILENO) << out;
  }
}

} // end namespace lexcmp::lexsort
