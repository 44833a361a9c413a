#pragma once
#include "util/common.h++"
#include <lmdb.h>
#include <assert.h>
#include <string.h>
#include <byteswap.h>
#include <vector>

namespace Skein {
#  if __BIG_ENDIAN__
#    define swap_bytes(x) x
#  else
#    define swap_bytes(x) bswap_64(x)
#  endif

  // LMDB key made of one or two integers. Single-integer keys are stored in
  // native order (for MDB_INTEGERKEY), composite keys big-endian so that they
  // sort lexicographically.
  class Cursor final {
  private:
    uint64_t data[2];
    uint8_t size;
  public:
    Cursor(const MDB_val& v) {
      assert(v.mv_size <= sizeof(data));
      assert(v.mv_size > 0);
      assert(v.mv_size % sizeof(uint64_t) == 0);
      memcpy(data, v.mv_data, std::min(sizeof(data), v.mv_size));
      size = (uint8_t)(v.mv_size / sizeof(uint64_t));
    }
    Cursor(uint64_t a) : data{a, 0}, size(1) {}
    Cursor(uint64_t a, uint64_t b) : data{swap_bytes(a), swap_bytes(b)}, size(2) {}

    auto int_field_0() const -> uint64_t {
      if (size == 1) return data[0];
      return swap_bytes(data[0]);
    }
    auto int_field_1() const -> uint64_t {
      assert(size >= 2);
      return swap_bytes(data[1]);
    }
    auto val() -> MDB_val {
      return { size * sizeof(uint64_t), data };
    }

    auto to_string() const -> std::string {
      using fmt::operator""_cf;
      if (size == 1) return fmt::format("Cursor({:x})"_cf, int_field_0());
      return fmt::format("Cursor({:x},{:x})"_cf, int_field_0(), int_field_1());
    }
  };

# undef swap_bytes

  template <class T, typename std::enable_if<std::is_arithmetic<T>::value, T>::type* = nullptr>
  auto val_as(const MDB_val& v) noexcept -> T {
    T ret;
    assert(v.mv_size == sizeof(T));
    memcpy(&ret, v.mv_data, sizeof(T));
    return ret;
  }

  enum class Dir { Asc, Desc };

  // Iterates the values of an LMDB database from `from_key` until `to_key`
  // (exclusive). Every index in this project is a DUPSORT table of ids, so
  // dereferencing yields the current value as an id.
  class DBIter final {
  private:
    MDB_dbi dbi;
    MDB_txn* txn = nullptr;
    MDB_cursor* cur = nullptr;
    Dir dir;
    uint64_t count = 0;
    bool done = false, failed = false;
    std::optional<Cursor> to_key;

    auto reached_to_key() noexcept -> bool {
      if (!to_key) return false;
      auto val = to_key->val();
      const auto cmp = mdb_cmp(txn, dbi, &key, &val);
      return dir == Dir::Asc ? cmp >= 0 : cmp <= 0;
    }
  public:
    MDB_val key, value;
    struct Sentinel final { uint64_t limit; };
    // Single-pass: every copy advances the same cursor.
    struct Iterator final {
      DBIter* it;
      auto operator*() const noexcept -> uint64_t { return **it; }
      auto operator++() noexcept -> Iterator& { ++*it; return *this; }
      auto operator==(const Sentinel& s) const noexcept -> bool {
        return it->done || it->count >= s.limit;
      }
    };

    DBIter(
      MDB_dbi dbi,
      MDB_txn* txn,
      Dir dir,
      std::optional<Cursor> from_key = {},
      std::optional<Cursor> to_key = {}
    );

    DBIter(const DBIter&) = delete;
    auto operator=(const DBIter&) = delete;
    DBIter(DBIter&& from)
        : dbi(from.dbi), txn(from.txn), cur(from.cur), dir(from.dir), count(from.count),
          done(from.done), failed(from.failed), to_key(from.to_key),
          key(from.key), value(from.value) {
      from.cur = nullptr;
      from.done = true;
    };
    auto operator=(DBIter&&) = delete;
    ~DBIter() {
      if (cur != nullptr) mdb_cursor_close(cur);
    }

    auto is_done() const noexcept -> bool {
      return done;
    }
    auto has_failed() const noexcept -> bool {
      return failed;
    }
    auto operator*() const noexcept -> uint64_t {
      assert(!done);
      return val_as<uint64_t>(value);
    }
    auto operator++() noexcept -> DBIter&;
    auto begin() noexcept -> Iterator { return { this }; }
    auto end() noexcept -> Sentinel { return { ID_MAX }; }

    // Drains the iterator; callers that need every id in one go (e.g. to
    // modify the table they were iterating) use this.
    auto collect() -> std::vector<uint64_t> {
      std::vector<uint64_t> out;
      for (uint64_t id : *this) out.push_back(id);
      return out;
    }
  };

  // All duplicate values stored under one integer key.
  static inline auto dups_of(MDB_dbi dbi, MDB_txn* txn, uint64_t key) -> DBIter {
    return DBIter(dbi, txn, Dir::Asc, Cursor(key), key == ID_MAX ? std::optional<Cursor>() : std::optional<Cursor>(Cursor(key + 1)));
  }
}
