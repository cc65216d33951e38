#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "sqlite.hh"

using namespace lexcmp;

namespace {

class Collation: public ::testing::Test {
protected:
  sqlite db { ":memory:" };

  void SetUp() override {
    register_collations(db);
    db("CREATE TABLE names (name TEXT)");
    auto insert = db.prepare("INSERT INTO names VALUES (?)");
    for (const char* name : {
      "item10", "Item2", "item1", "éclair", "Eclair", "zeta", "10", "9"
    }) {
      insert.bind_all(name);
      insert.step();
      insert.reset();
    }
  }

  std::vector<std::string> ordered(const std::string& collation) {
    auto select = db.prepare(
      "SELECT name FROM names ORDER BY name COLLATE " + collation);
    std::vector<std::string> names;
    while (select.step()) names.push_back(select.column<std::string>(0));
    return names;
  }
};

}

TEST_F(Collation, NaturalNocase) {
  EXPECT_EQ(ordered("NATURAL_NOCASE"), (std::vector<std::string>{
    "9", "10", "Eclair", "éclair", "item1", "Item2", "item10", "zeta" }));
}

TEST_F(Collation, Lexical) {
  EXPECT_EQ(ordered("LEXICAL"), (std::vector<std::string>{
    "10", "9", "Eclair", "Item2", "éclair", "item1", "item10", "zeta" }));
}

TEST_F(Collation, LexicalNocaseAndNatural) {
  EXPECT_EQ(ordered("LEXICAL_NOCASE"), (std::vector<std::string>{
    "10", "9", "Eclair", "éclair", "item1", "item10", "Item2", "zeta" }));
  EXPECT_EQ(ordered("NATURAL"), (std::vector<std::string>{
    "9", "10", "Eclair", "Item2", "éclair", "item1", "item10", "zeta" }));
}

TEST_F(Collation, UsableInIndexesAndComparisons) {
  db("CREATE INDEX names_natural ON names (name COLLATE NATURAL_NOCASE)");
  auto count = db.prepare(
    "SELECT count(*) FROM names WHERE name < 'item3' COLLATE NATURAL_NOCASE");
  ASSERT_TRUE(count.step());
  // 9, 10, Eclair, éclair, item1, Item2
  EXPECT_EQ(count.column<int>(0), 6);
}

TEST_F(Collation, UnknownCollationThrows) {
  EXPECT_THROW(ordered("NOPE"), lexcmp::error);
}
