#include "iter.h++"

using std::optional;

namespace Skein {
  DBIter::DBIter(
    MDB_dbi dbi,
    MDB_txn* txn,
    Dir dir,
    optional<Cursor> from_key,
    optional<Cursor> to_key
  ) : dbi(dbi), txn(txn), dir(dir), to_key(to_key) {
    int err;
    if ((err = mdb_cursor_open(txn, dbi, &cur))) {
      spdlog::error("Failed to create iterator: {}", mdb_strerror(err));
      cur = nullptr;
      done = failed = true;
      return;
    }
    if (from_key) key = from_key->val();
    err = mdb_cursor_get(cur, &key, &value, dir == Dir::Asc
      ? (from_key ? MDB_SET_RANGE : MDB_FIRST)
      : (from_key ? MDB_SET_KEY : MDB_LAST)
    );
    if (!err && dir == Dir::Desc && from_key) {
      err = mdb_cursor_get(cur, &key, &value, MDB_LAST_DUP);
    } else if (err == MDB_NOTFOUND && dir == Dir::Desc && from_key) {
      err = mdb_cursor_get(cur, &key, &value, MDB_PREV);
    }
    if (err) {
      if (err != MDB_NOTFOUND) {
        failed = true;
        spdlog::error("Database error in iterator: {}", mdb_strerror(err));
      }
      done = true;
    } else done = reached_to_key();
  }

  auto DBIter::operator++() noexcept -> DBIter& {
    if (done) {
      return *this;
    } else if (const auto err = mdb_cursor_get(cur, &key, &value, dir == Dir::Asc ? MDB_NEXT : MDB_PREV)) {
      if (err != MDB_NOTFOUND) {
        failed = true;
        spdlog::error("Database error in iterator: {}", mdb_strerror(err));
      }
      done = true;
    } else if (reached_to_key()) {
      done = true;
    } else {
      count++;
    }
    return *this;
  }
}
