#include "sqlite.hh"
#include "cmp.hh"

namespace lexcmp {
namespace {

int collate(void* arg, int n1, const void* s1, int n2, const void* s2) {
  const auto ord = compare(
    std::string_view(static_cast<const char*>(s1), n1),
    std::string_view(static_cast<const char*>(s2), n2),
    *static_cast<const options*>(arg));
  return (ord > 0) - (ord < 0);
}

struct collation {
  const char* name;
  const options* opt;
};

constexpr collation collations[] = {
  { "LEXICAL",        &opts::lexicographic        },
  { "LEXICAL_NOCASE", &opts::lexicographic_nocase },
  { "NATURAL",        &opts::natural              },
  { "NATURAL_NOCASE", &opts::natural_nocase       },
};

}

void register_collations(sqlite3* db) {
  for (const auto& [name, opt] : collations)
    if (sqlite3_create_collation_v2(
      db, name, SQLITE_UTF8, const_cast<options*>(opt), collate, nullptr
    ) != SQLITE_OK)
      ERROR("sqlite3_create_collation_v2(",name,"): ",sqlite3_errmsg(db));
}

void register_collations(sqlite& db) { register_collations(+db); }

} // end namespace lexcmp
