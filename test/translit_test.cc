#include <gtest/gtest.h>

#include <compare>
#include <string>
#include <utility>

#include "translit.hh"
#include "translit_stream.hh"
#include "cmp.hh"

using namespace lexcmp;

TEST(Translit, AsciiMapsToItself) {
  for (char32_t c=0; c<0x80; ++c) {
    const auto s = translit(c);
    ASSERT_EQ(s.size(), 1u);
    EXPECT_EQ(static_cast<unsigned char>(s[0]), c);
  }
}

TEST(Translit, LatinDiacriticsAndLigatures) {
  EXPECT_EQ(translit(U'á'), "a");
  EXPECT_EQ(translit(U'Á'), "A");
  EXPECT_EQ(translit(U'ß'), "ss");
  EXPECT_EQ(translit(U'ẞ'), "SS");
  EXPECT_EQ(translit(U'Æ'), "AE");
  EXPECT_EQ(translit(U'œ'), "oe");
  EXPECT_EQ(translit(U'Ł'), "L");
  EXPECT_EQ(translit(U'ș'), "s");
  EXPECT_EQ(translit(U'ạ'), "a");
  EXPECT_EQ(translit(U'ỹ'), "y");
  EXPECT_EQ(translit(U'ﬁ'), "fi");
  EXPECT_EQ(translit(U'ﬄ'), "ffl");
}

TEST(Translit, OtherScripts) {
  EXPECT_EQ(translit(U'Ω'), "O");
  EXPECT_EQ(translit(U'θ'), "th");
  EXPECT_EQ(translit(U'ж'), "zh");
  EXPECT_EQ(translit(U'Щ'), "Shch");
  EXPECT_EQ(transliterate("Ωμέγα"), "Omega");
  EXPECT_EQ(transliterate("Москва"), "Moskva");
  EXPECT_EQ(transliterate("Ærøskøbing"), "AEroskobing");
}

TEST(Translit, SymbolsAndForms) {
  EXPECT_EQ(translit(U'€'), "EUR");
  EXPECT_EQ(translit(U'™'), "TM");
  EXPECT_EQ(translit(U'½'), "1/2");
  EXPECT_EQ(translit(U'Ⅻ'), "XII");
  EXPECT_EQ(translit(U'²'), "2");
  EXPECT_EQ(translit(U'“'), "\"");
  EXPECT_EQ(translit(U'—'), "--");
  EXPECT_EQ(translit(U'…'), "...");
  EXPECT_EQ(translit(U'Ａ'), "A");
  EXPECT_EQ(translit(U'ｚ'), "z");
  EXPECT_EQ(translit(U'０'), "0");
}

TEST(Translit, PictographsBecomeWords) {
  EXPECT_EQ(translit(U'😀'), "grinning");
  EXPECT_EQ(translit(U'🔥'), "fire");
  EXPECT_EQ(translit(U'♥'), "hearts");
  EXPECT_EQ(transliterate("😀 ok"), "grinning ok");
}

TEST(Translit, EmojiNeighboursAreNamedToo) {
  EXPECT_EQ(translit(U'🍌'), "banana");
  EXPECT_EQ(translit(U'😋'), "face_savouring_delicious_food");
  EXPECT_EQ(translit(U'🦊'), "fox_face");
  EXPECT_EQ(translit(U'🚀'), "rocket");
  EXPECT_EQ(translit(U'✅'), "white_heavy_check_mark");
  EXPECT_EQ(translit(U'❸'), "3");
  EXPECT_EQ(translit(U'🏽'), "medium_skin_tone");
  EXPECT_EQ(transliterate("🇫🇷"), "FR");
}

TEST(Translit, EmojiBlocksHaveNoGaps) {
  const std::pair<char32_t,char32_t> blocks[] = {
    { 0x2600, 0x27C0 },   // symbols, dingbats
    { 0x1F300, 0x1F650 }, // pictographs, emoticons
    { 0x1F900, 0x1FA00 }, // supplemental pictographs
  };
  for (const auto& [first, last] : blocks)
    for (char32_t c=first; c<last; ++c)
      EXPECT_FALSE(translit(c).empty()) << std::hex << static_cast<unsigned>(c);
}

TEST(Translit, EmojiSortAmongWords) {
  for (const char* emoji : { "🍌", "🍎", "🐱", "🦊", "😋", "🚲" }) {
    EXPECT_EQ(lexicographic_icmp(emoji,"zzz"), std::strong_ordering::less)
      << emoji;
    EXPECT_EQ(lexicographic_icmp(emoji,"aaa"), std::strong_ordering::greater)
      << emoji;
  }
}

TEST(Translit, UnknownCharactersPassThrough) {
  EXPECT_TRUE(translit(U'中').empty());
  EXPECT_TRUE(translit(0x0301).empty()); // combining acute
  EXPECT_TRUE(translit(0x10FFFF).empty());
  EXPECT_EQ(transliterate("中文"), "中文");
  EXPECT_EQ(transliterate("naïve café"), "naive cafe");
}

TEST(Translit, EveryEntryIsPrintableAscii) {
  for (char32_t c=0x80; c<0x110000; ++c) {
    for (const char ch : translit(c)) {
      ASSERT_GE(ch, 0x20) << std::hex << static_cast<unsigned>(c);
      ASSERT_LE(ch, 0x7E) << std::hex << static_cast<unsigned>(c);
    }
  }
}

namespace {

std::u32string drain(std::string_view s, const options& opt, bool drop) {
  std::u32string out;
  for (translit_stream<char> st(s,opt,drop); !st.at_end(); ++st)
    out += *st;
  return out;
}

}

TEST(TranslitStream, ExpandsLazily) {
  EXPECT_EQ(drain("Straße", opts::lexicographic, false), U"Strasse");
  EXPECT_EQ(drain("Straße", opts::lexicographic_nocase, false), U"strasse");
  EXPECT_EQ(drain("", opts::lexicographic, false), U"");
}

TEST(TranslitStream, DropsSeparatorsWhenAsked) {
  EXPECT_EQ(drain("ﬁ-5 x", opts::lexicographic_nocase, true), U"fi5x");
  EXPECT_EQ(drain("- . -", opts::lexicographic, true), U"");
  EXPECT_EQ(drain("a—b", opts::lexicographic, true), U"ab");
}

TEST(TranslitStream, RawModeAndUnknownCharacters) {
  options raw;
  raw.transliterate = false;
  EXPECT_EQ(drain("é", raw, false), U"é");
  EXPECT_EQ(drain("中x", opts::lexicographic, false), U"中x");
  EXPECT_EQ(drain("中", opts::lexicographic, true), U"中");
}
