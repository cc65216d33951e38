#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <string_view>
#include <vector>

#include "cmp.hh"

using namespace lexcmp;
using std::strong_ordering;

namespace {

const std::vector<std::string_view> corpus {
  "", "a", "A", "á", "Á", "ä", "aa", "áa", "ab", "AB", "Ab", "ae", "AE", "æ",
  "af", "straße", "strasse", "Strasse", "Foo", "fóò", "foo", "f5", "f-5",
  "f05", "f 5", "F5", "item2", "item10", "item02", "50", "100", "007", "7",
  "-", "-$", "-a", ".", "--", "1.5", "10", "v1.10", "v1.9", "中", "中文",
  "😀", "grinning", "\xFF", "\xFE", "ﬁle", "file", "x²", "x2", "１２", "12",
  "a-b", "ab1", "ab-1", "Ω", "o",
};

struct named_options {
  const char* name;
  options opt;
};

std::vector<named_options> all_options() {
  options raw;
  raw.transliterate = false;
  options raw_natural = opts::natural_nocase;
  raw_natural.transliterate = false;
  options keep_separators = opts::natural_nocase;
  keep_separators.only_alnum = false;
  options alnum = opts::lexicographic_nocase;
  alnum.only_alnum = true;
  return {
    { "lexicographic", opts::lexicographic },
    { "lexicographic_nocase", opts::lexicographic_nocase },
    { "natural", opts::natural },
    { "natural_nocase", opts::natural_nocase },
    { "raw", raw },
    { "raw_natural", raw_natural },
    { "natural_keep_separators", keep_separators },
    { "lexicographic_alnum", alnum },
  };
}

class TotalOrder: public ::testing::TestWithParam<named_options> { };

}

TEST_P(TotalOrder, ReflexiveAndStrict) {
  const auto& opt = GetParam().opt;
  for (const auto a : corpus)
    for (const auto b : corpus) {
      const auto ord = compare(a,b,opt);
      EXPECT_EQ(ord == 0, a == b) << a << " vs " << b;
    }
}

TEST_P(TotalOrder, Antisymmetric) {
  const auto& opt = GetParam().opt;
  for (const auto a : corpus)
    for (const auto b : corpus)
      EXPECT_EQ(compare(a,b,opt) < 0, compare(b,a,opt) > 0)
        << a << " vs " << b;
}

TEST_P(TotalOrder, Transitive) {
  const auto& opt = GetParam().opt;
  for (const auto a : corpus)
    for (const auto b : corpus) {
      if (compare(a,b,opt) > 0) continue;
      for (const auto c : corpus)
        if (compare(b,c,opt) <= 0)
          EXPECT_TRUE(compare(a,c,opt) <= 0)
            << a << " <= " << b << " <= " << c;
    }
}

TEST_P(TotalOrder, WeakOrderIsConsistent) {
  const auto& opt = GetParam().opt;
  for (const auto a : corpus)
    for (const auto b : corpus) {
      const auto weak = weak_compare(a,b,opt);
      if (weak != 0) {
        EXPECT_EQ(compare(a,b,opt) < 0, weak < 0) << a << " vs " << b;
      }
    }
}

TEST_P(TotalOrder, SortingIsIdempotentAndIndependentOfInputOrder) {
  const auto& opt = GetParam().opt;
  auto first = corpus;
  std::sort(first.begin(),first.end(),less{opt});

  std::mt19937 gen(42);
  for (int i=0; i<5; ++i) {
    auto v = corpus;
    std::shuffle(v.begin(),v.end(),gen);
    std::sort(v.begin(),v.end(),less{opt});
    EXPECT_EQ(v, first);
    std::sort(v.begin(),v.end(),less{opt});
    EXPECT_EQ(v, first);
  }
}

INSTANTIATE_TEST_SUITE_P(Options, TotalOrder,
  ::testing::ValuesIn(all_options()),
  [](const auto& info){ return std::string(info.param.name); });
