#ifndef LEXCMP_SQLITE_HH
#define LEXCMP_SQLITE_HH

#include <iostream>
#include <concepts>
#include <string_view>
#include <utility>

#include <sqlite3.h>
// https://sqlite.org/cintro.html

#include "error.hh"

#define THROW_SQLITE(...) ERROR(__VA_ARGS__,": ",errmsg())

namespace lexcmp {

class sqlite {
  sqlite3* db = nullptr;

public:
  const char* errmsg() const noexcept { return sqlite3_errmsg(db); }

  sqlite(const char* filename) {
    if (sqlite3_open(filename,&db) != SQLITE_OK)
      THROW_SQLITE("sqlite3_open(",filename,")");
  }
  ~sqlite() {
    if (sqlite3_close(db) != SQLITE_OK)
      std::cerr << LEXCMP_ERROR_PREF "sqlite3_close(): "
        << errmsg() << std::endl;
  }
  sqlite(const sqlite&) = delete;
  sqlite& operator=(const sqlite&) = delete;

  sqlite3* operator+() noexcept { return db; }

  // Prepared statement; text is bound as a transient copy
  class stmt {
    sqlite3_stmt *p = nullptr;

    const char* errmsg() const noexcept {
      return sqlite3_errmsg(sqlite3_db_handle(p));
    }

  public:
    stmt(sqlite3 *db, std::string_view sql) {
      if (sqlite3_prepare_v2(db, sql.data(), sql.size(), &p, nullptr)
        != SQLITE_OK
      ) ERROR("sqlite3_prepare_v2(): ",sqlite3_errmsg(db));
    }
    ~stmt() { sqlite3_finalize(p); }
    stmt(const stmt&) = delete;
    stmt& operator=(const stmt&) = delete;

    // true while there are rows
    bool step() {
      switch (sqlite3_step(p)) {
        case SQLITE_ROW: return true;
        case SQLITE_DONE: return false;
        default: THROW_SQLITE("sqlite3_step()");
      }
    }
    stmt& reset() {
      if (sqlite3_reset(p) != SQLITE_OK)
        THROW_SQLITE("sqlite3_reset()");
      return *this;
    }

    stmt& bind(int i, std::string_view text) {
      if (sqlite3_bind_text(p, i, text.data(), text.size(), SQLITE_TRANSIENT)
        != SQLITE_OK
      ) THROW_SQLITE("sqlite3_bind_text(",std::to_string(i),")");
      return *this;
    }
    template <typename... T>
    stmt& bind_all(T&&... x) {
      int i = 0;
      return (bind(++i,std::forward<T>(x)), ...);
    }

    std::string_view column_text(int i) noexcept {
      const auto* s = reinterpret_cast<const char*>(sqlite3_column_text(p, i));
      return { s ? s : "", static_cast<size_t>(sqlite3_column_bytes(p, i)) };
    }
    template <typename T> requires std::integral<T>
    T column(int i) noexcept {
      return static_cast<T>(sqlite3_column_int64(p, i));
    }
    template <typename T> requires std::constructible_from<T,std::string_view>
    T column(int i) { return T(column_text(i)); }
  };

  stmt prepare(std::string_view sql) { return { db, sql }; }

  sqlite& exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db,sql,nullptr,nullptr,&err) != SQLITE_OK) {
      const std::string msg = err ? err : errmsg();
      sqlite3_free(err);
      ERROR("sqlite3_exec(): ",msg);
    }
    return *this;
  }
  sqlite& operator()(const char* sql) { return exec(sql); }
};

// Installs the collations LEXICAL, LEXICAL_NOCASE, NATURAL and
// NATURAL_NOCASE, backed by the four canonical comparators.
void register_collations(sqlite& db);
void register_collations(sqlite3* db);

} // end namespace lexcmp

#endif
