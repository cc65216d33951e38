#include <gtest/gtest.h>

#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

#include "lexsort.hh"
#include "whole_file.hh"
#include "zlib.hh"

using namespace lexcmp;

namespace {

// Mutable argv for getopt; parsed settings point into it
class command_line {
  std::vector<std::string> args;
  std::vector<char*> ptrs;
public:
  command_line(std::initializer_list<const char*> list)
  : args(list.begin(),list.end()) {
    for (auto& arg : args) ptrs.push_back(arg.data());
    ptrs.push_back(nullptr);
  }
  lexsort::settings parse() {
    return lexsort::parse_args(static_cast<int>(ptrs.size())-1,ptrs.data());
  }
};

std::string run(
  std::initializer_list<const char*> args, std::vector<std::string> texts
) {
  return lexsort::process(command_line(args).parse(),std::move(texts));
}

}

TEST(LexsortArgs, Flags) {
  command_line cl {
    "lexsort", "-ni", "-rutz", "-o", "out.txt", "a.txt", "-", "b.txt"
  };
  const auto args = cl.parse();
  EXPECT_EQ(args.opt.ordering, ordering_mode::natural);
  EXPECT_EQ(args.opt.letter_case, case_mode::insensitive);
  EXPECT_TRUE(args.opt.only_alnum);
  EXPECT_TRUE(args.opt.transliterate);
  EXPECT_TRUE(args.reverse);
  EXPECT_TRUE(args.unique);
  EXPECT_TRUE(args.show);
  EXPECT_TRUE(args.gz);
  EXPECT_FALSE(args.help);
  ASSERT_NE(args.out_name, nullptr);
  EXPECT_STREQ(args.out_name, "out.txt");
  ASSERT_EQ(args.inputs.size(), 3u);
  EXPECT_STREQ(args.inputs[0], "a.txt");
  EXPECT_STREQ(args.inputs[1], "-");
  EXPECT_STREQ(args.inputs[2], "b.txt");
}

TEST(LexsortArgs, Defaults) {
  const auto args = command_line{ "lexsort" }.parse();
  EXPECT_EQ(args.opt.ordering, ordering_mode::lexicographic);
  EXPECT_EQ(args.opt.letter_case, case_mode::sensitive);
  EXPECT_FALSE(args.opt.only_alnum);
  EXPECT_FALSE(args.reverse);
  EXPECT_EQ(args.out_name, nullptr);
  EXPECT_TRUE(args.inputs.empty());
}

TEST(LexsortArgs, FlagsAfterFiles) {
  command_line cl { "lexsort", "a.txt", "-R", "-a" };
  const auto args = cl.parse();
  EXPECT_FALSE(args.opt.transliterate);
  EXPECT_TRUE(args.opt.only_alnum);
  ASSERT_EQ(args.inputs.size(), 1u);
  EXPECT_STREQ(args.inputs[0], "a.txt");
}

TEST(LexsortArgs, BadCommandLines) {
  EXPECT_THROW(command_line({ "lexsort", "-x" }).parse(),
               lexsort::usage_error);
  EXPECT_THROW(command_line({ "lexsort", "-o" }).parse(),
               lexsort::usage_error);
  EXPECT_TRUE(command_line({ "lexsort", "-h" }).parse().help);
}

TEST(LexsortArgs, UsageListsEveryFlag) {
  std::ostringstream os;
  lexsort::usage(os,"lexsort");
  const auto text = os.str();
  EXPECT_EQ(text.rfind("usage: lexsort ",0), 0u);
  for (const char* flag :
       { "-n", "-a", "-i", "-R", "-r", "-u", "-t", "-z", "-o" })
    EXPECT_NE(text.find(std::string("\n  ") + flag + "  "), std::string::npos)
      << flag;
}

TEST(Lexsort, SortsLines) {
  const std::string text = "b\nA\na\n10\n9\n";
  EXPECT_EQ(run({ "lexsort" }, { text }), "10\n9\nA\na\nb\n");
  EXPECT_EQ(run({ "lexsort", "-n" }, { text }), "9\n10\nA\na\nb\n");
  EXPECT_EQ(run({ "lexsort", "-i" }, { "b\nB\na\n" }), "a\nB\nb\n");
}

TEST(Lexsort, ReverseAndUnique) {
  EXPECT_EQ(run({ "lexsort", "-r" }, { "a\nc\nb\n" }), "c\nb\na\n");
  EXPECT_EQ(run({ "lexsort", "-u" }, { "b\na\nb\na\n" }), "a\nb\n");
  EXPECT_EQ(run({ "lexsort", "-ur" }, { "b\na\nb\n" }), "b\na\n");
}

TEST(Lexsort, PunctuationAndRawCharacters) {
  EXPECT_EQ(run({ "lexsort" }, { "ab\na-c\n" }), "a-c\nab\n");
  EXPECT_EQ(run({ "lexsort", "-a" }, { "a-c\nab\n" }), "ab\na-c\n");
  EXPECT_EQ(run({ "lexsort" }, { "f\né\n" }), "é\nf\n");
  EXPECT_EQ(run({ "lexsort", "-R" }, { "é\nf\n" }), "f\né\n");
}

TEST(Lexsort, ShowsTransliterationInInputOrder) {
  EXPECT_EQ(run({ "lexsort", "-t" }, { "Straße\nnaïve\n😀\n" }),
            "Strasse\nnaive\ngrinning\n");
}

TEST(Lexsort, MergesInputsAndInflatesGzip) {
  EXPECT_EQ(run({ "lexsort" }, { zlib::deflate("b\nd\n"), "c\na" }),
            "a\nb\nc\nd\n");
  EXPECT_EQ(run({ "lexsort" }, { "" }), "");
}

TEST(Lexsort, GzipOutput) {
  const auto out = run({ "lexsort", "-z" }, { "b\na\n" });
  ASSERT_TRUE(zlib::is_gzip(out));
  EXPECT_EQ(zlib::inflate(out), "a\nb\n");
}

TEST(Lexsort, ReadsAndWritesFiles) {
  const std::string in = ::testing::TempDir() + "lexsort_in.txt";
  const std::string out = ::testing::TempDir() + "lexsort_out.txt";

  command_line cl { "lexsort", "-o", out.c_str() };
  auto args = cl.parse();
  lexsort::write_output(args,zlib::deflate("y\nx\n"));
  EXPECT_EQ(
    lexsort::process(args,{ lexsort::read_input(out.c_str()) }),
    "x\ny\n");

  // the output file is truncated
  args.out_name = in.c_str();
  lexsort::write_output(args,"a long first version\n");
  lexsort::write_output(args,"short\n");
  EXPECT_EQ(whole_file(in.c_str()), "short\n");

  EXPECT_THROW(lexsort::read_input("/nonexistent/lexsort"), lexcmp::error);
}
