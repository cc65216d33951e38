#include <gtest/gtest.h>

#include <algorithm>
#include <string_view>
#include <vector>

#include "cmp.hh"

using namespace lexcmp;
using std::strong_ordering;
using std::weak_ordering;

TEST(Natural, NumbersCompareByValue) {
  EXPECT_EQ(natural_cmp("50","100"), strong_ordering::less);
  EXPECT_EQ(natural_cmp("100","50"), strong_ordering::greater);
  EXPECT_EQ(natural_cmp("item2","item10"), strong_ordering::less);
  EXPECT_EQ(natural_cmp("a32","a4"), strong_ordering::greater);
  EXPECT_EQ(natural_cmp("a32","a04"), strong_ordering::greater);
  EXPECT_EQ(natural_cmp("a32","a40"), strong_ordering::less);
  EXPECT_EQ(natural_cmp("v123","v124"), strong_ordering::less);
}

TEST(Natural, NumbersBeyondMachineIntegers) {
  EXPECT_EQ(natural_cmp("x99999999999999999999999",
                        "x100000000000000000000000"), strong_ordering::less);
  EXPECT_EQ(natural_cmp("x100000000000000000000001",
                        "x100000000000000000000000"), strong_ordering::greater);
}

TEST(Natural, LeadingZerosAreEquivalent) {
  EXPECT_EQ(weak_compare("007","7",opts::natural), weak_ordering::equivalent);
  EXPECT_EQ(weak_compare("0","000",opts::natural), weak_ordering::equivalent);
  EXPECT_EQ(natural_cmp("007","7"), strong_ordering::less);
  EXPECT_EQ(natural_cmp("7","007"), strong_ordering::greater);
  EXPECT_EQ(natural_cmp("008","7"), strong_ordering::greater);
}

TEST(Natural, SeparatorsAreSkipped) {
  EXPECT_EQ(weak_compare("f-5","f5",opts::natural), weak_ordering::equivalent);
  EXPECT_EQ(weak_compare("f 5","f_5",opts::natural), weak_ordering::equivalent);
  EXPECT_EQ(natural_cmp("f-5","f5"), strong_ordering::less);
  EXPECT_EQ(natural_cmp("f5","f-5"), strong_ordering::greater);
}

TEST(Natural, SeparatorsEndTokens) {
  EXPECT_EQ(natural_cmp("1.5","10"), strong_ordering::less);
  EXPECT_EQ(natural_icmp("v1.10","v1.9"), strong_ordering::greater);
  EXPECT_EQ(natural_cmp("a-b","ab"), strong_ordering::less);
}

TEST(Natural, OnlySeparatorsIsEmpty) {
  EXPECT_EQ(weak_compare("--","...",opts::natural), weak_ordering::equivalent);
  EXPECT_EQ(weak_compare("--","",opts::natural), weak_ordering::equivalent);
  EXPECT_EQ(natural_cmp("","--"), strong_ordering::less);
  EXPECT_EQ(natural_cmp("--","a"), strong_ordering::less);
  EXPECT_EQ(natural_cmp("--","0"), strong_ordering::less);
}

TEST(Natural, DigitsSortBeforeLetters) {
  EXPECT_EQ(natural_cmp("1a","a1"), strong_ordering::less);
  EXPECT_EQ(natural_cmp("a","1"), strong_ordering::greater);
  EXPECT_EQ(natural_icmp("x9","xa"), strong_ordering::less);
}

TEST(Natural, CaseSensitivity) {
  EXPECT_EQ(natural_cmp("B","a"), strong_ordering::less);
  EXPECT_EQ(natural_icmp("B","a"), strong_ordering::greater);
  EXPECT_EQ(natural_icmp("A2","a10"), strong_ordering::less);
}

TEST(Natural, TransliteratedDigits) {
  EXPECT_EQ(natural_cmp("file２","file10"), strong_ordering::less);
  EXPECT_EQ(weak_compare("x²","x2",opts::natural), weak_ordering::equivalent);
  EXPECT_EQ(natural_icmp("Ⅻ","xi"), strong_ordering::greater);
}

TEST(Natural, SortedList) {
  std::vector<std::string_view> v {
    "ß", "é", "100", "hello", "world", "50", ".", "B!"
  };
  std::sort(v.begin(),v.end(),less{opts::natural_nocase});
  const std::vector<std::string_view> expected {
    ".", "50", "100", "B!", "é", "hello", "ß", "world"
  };
  EXPECT_EQ(v, expected);
}

TEST(Natural, KeepingSeparators) {
  // natural numbers without ignoring punctuation
  const options opt {
    ordering_mode::natural, case_mode::insensitive, true, false };
  const std::vector<std::string_view> sorted {
    "-", "-$", "-a", "50", "100", "a", "ä", "aa", "áa",
    "AB", "Ab", "ab", "AE", "ae", "æ", "af"
  };
  for (size_t i=0; i<sorted.size(); ++i)
    for (size_t j=i+1; j<sorted.size(); ++j)
      EXPECT_EQ(compare(sorted[i],sorted[j],opt), strong_ordering::less)
        << sorted[i] << " vs " << sorted[j];

  // "f-" is a longer word than "f"
  EXPECT_EQ(weak_compare("f-5","f5",opt), weak_ordering::greater);
}
