#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include <unistd.h>

#include "zlib.hh"
#include "whole_file.hh"
#include "file_desc.hh"
#include "error.hh"

using namespace lexcmp;

namespace {

std::string sample() {
  std::string s;
  for (int i=0; i<1000; ++i)
    s += "item" + std::to_string(i) + " straße fóò\n";
  return s;
}

}

TEST(Zlib, GzipRoundTrip) {
  const auto text = sample();
  const auto gz = zlib::deflate(text);
  EXPECT_TRUE(zlib::is_gzip(gz));
  EXPECT_LT(gz.size(), text.size());
  EXPECT_EQ(zlib::inflate(gz), text);
}

TEST(Zlib, ZlibStreamsAreDetected) {
  const auto z = zlib::deflate("plain zlib",false);
  EXPECT_FALSE(zlib::is_gzip(z));
  EXPECT_EQ(zlib::inflate(z), "plain zlib");
}

TEST(Zlib, EmptyInput) {
  EXPECT_EQ(zlib::inflate(zlib::deflate("")), "");
}

TEST(Zlib, CorruptInputThrows) {
  EXPECT_THROW(zlib::inflate("not compressed at all"), lexcmp::error);
  const auto gz = zlib::deflate(sample());
  EXPECT_THROW(zlib::inflate(std::string_view(gz).substr(0,gz.size()/2)),
               lexcmp::error);
}

TEST(WholeFile, ReadsRegularFiles) {
  const std::string name = ::testing::TempDir() + "lexcmp_whole_file.txt";
  const auto text = sample();
  { std::ofstream(name,std::ios::binary) << text; }
  EXPECT_EQ(whole_file(name.c_str()), text);
}

TEST(WholeFile, RejectsDirectoriesAndMissingFiles) {
  EXPECT_THROW(whole_file(::testing::TempDir().c_str()), lexcmp::error);
  EXPECT_THROW(whole_file("/nonexistent/lexcmp"), lexcmp::error);
  EXPECT_THROW(whole_file(""), lexcmp::error);
}

TEST(WholeFile, ReadsPipesToTheEnd) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  const std::string text = "piped\ntext\n";
  file_desc{fds[1]} << text;
  ::close(fds[1]);
  EXPECT_EQ(whole_fd(fds[0]), text);
  ::close(fds[0]);
}
