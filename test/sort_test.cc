#include <gtest/gtest.h>

#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "sort.hh"

using namespace lexcmp;

TEST(Sort, Strings) {
  std::vector<std::string> v { "Lorem", "ipsum", "dolor", "sit", "amet" };
  lex_sort(v,opts::natural_nocase);
  EXPECT_EQ(v, (std::vector<std::string>{
    "amet", "dolor", "ipsum", "Lorem", "sit" }));
}

TEST(Sort, IteratorRange) {
  std::string_view a[] { "The", "quick", "brown", "fox" };
  lex_sort(std::begin(a),std::end(a),opts::lexicographic_nocase);
  EXPECT_EQ(a[0], "brown");
  EXPECT_EQ(a[1], "fox");
  EXPECT_EQ(a[2], "quick");
  EXPECT_EQ(a[3], "The");
}

TEST(Sort, TemporaryRange) {
  std::vector<std::string> v { "x10", "x9", "x1", "b" };
  lex_sort(std::span(v).subspan(1),opts::natural);
  EXPECT_EQ(v, (std::vector<std::string>{ "x10", "b", "x1", "x9" }));
  lex_sort(std::span(v),opts::natural);
  EXPECT_EQ(v, (std::vector<std::string>{ "b", "x1", "x9", "x10" }));
}

TEST(Sort, StableKeepsTheOnlyOrderThereIs) {
  std::vector<std::string_view> v { "file10", "File2", "file1", "fíle1" };
  lex_stable_sort(v,opts::natural_nocase);
  EXPECT_EQ(v, (std::vector<std::string_view>{
    "file1", "fíle1", "File2", "file10" }));
}

TEST(Sort, ByProjection) {
  const auto trim = [](std::string_view s){
    s.remove_prefix(std::min(s.find_first_not_of(' '),s.size()));
    return s;
  };
  std::vector<std::string_view> v { " moe", "Eeny", " miny", " meeny" };
  lex_sort_by(v,opts::lexicographic_nocase,trim);
  EXPECT_EQ(v, (std::vector<std::string_view>{
    "Eeny", " meeny", " miny", " moe" }));

  struct item { std::string name; int id; };
  std::vector<item> items { { "b10", 1 }, { "B9", 2 }, { "a", 3 } };
  lex_stable_sort_by(items,opts::natural_nocase,
    [](const item& x) -> const std::string& { return x.name; });
  EXPECT_EQ(items[0].id, 3);
  EXPECT_EQ(items[1].id, 2);
  EXPECT_EQ(items[2].id, 1);
}

TEST(Sort, Paths) {
  std::vector<std::filesystem::path> v {
    "dir/file10.txt", "dir/file2.txt", "Dir/a"
  };
  path_sort(v,opts::natural_nocase);
  EXPECT_EQ(v[0].native(), "Dir/a");
  EXPECT_EQ(v[1].native(), "dir/file2.txt");
  EXPECT_EQ(v[2].native(), "dir/file10.txt");

  path_stable_sort(v,opts::lexicographic);
  EXPECT_EQ(v[0].native(), "Dir/a");
  EXPECT_EQ(v[1].native(), "dir/file10.txt");
  EXPECT_EQ(v[2].native(), "dir/file2.txt");
}
