#include "test_common.h++"
#include "util/iter.h++"

static constexpr unsigned ID_SET = MDB_INTEGERKEY | MDB_DUPSORT | MDB_DUPFIXED | MDB_INTEGERDUP;

static inline auto db_put(MDB_txn* txn, MDB_dbi dbi, Cursor k, uint64_t v) -> void {
  MDB_val kval = k.val();
  MDB_val vval { sizeof(uint64_t), &v };
  REQUIRE(!mdb_put(txn, dbi, &kval, &vval, 0));
}

static inline auto fill(TempDB& db) -> void {
  MDB_txn* txn;
  REQUIRE(!mdb_txn_begin(db.env, nullptr, 0, &txn));
  db_put(txn, db.dbi, Cursor(10), 103);
  db_put(txn, db.dbi, Cursor(10), 101);
  db_put(txn, db.dbi, Cursor(20), 205);
  db_put(txn, db.dbi, Cursor(30), 309);
  db_put(txn, db.dbi, Cursor(30), 301);
  db_put(txn, db.dbi, Cursor(30), 305);
  REQUIRE(!mdb_txn_commit(txn));
}

TEST_CASE("iterate over every id in order", "[iter]") {
  TempDB db(ID_SET);
  fill(db);
  MDB_txn* txn;
  REQUIRE(!mdb_txn_begin(db.env, nullptr, MDB_RDONLY, &txn));
  vector<uint64_t> xs;
  for (auto n : DBIter(db.dbi, txn, Dir::Asc)) xs.push_back(n);
  CHECK(xs == vector<uint64_t>{101, 103, 205, 301, 305, 309});
  xs.clear();
  for (auto n : DBIter(db.dbi, txn, Dir::Desc)) xs.push_back(n);
  CHECK(xs == vector<uint64_t>{309, 305, 301, 205, 103, 101});
  mdb_txn_abort(txn);
}

TEST_CASE("dups_of lists the values of one key", "[iter]") {
  TempDB db(ID_SET);
  fill(db);
  MDB_txn* txn;
  REQUIRE(!mdb_txn_begin(db.env, nullptr, MDB_RDONLY, &txn));
  CHECK(dups_of(db.dbi, txn, 10).collect() == vector<uint64_t>{101, 103});
  CHECK(dups_of(db.dbi, txn, 20).collect() == vector<uint64_t>{205});
  CHECK(dups_of(db.dbi, txn, 30).collect() == vector<uint64_t>{301, 305, 309});
  CHECK(dups_of(db.dbi, txn, 15).collect().empty());
  CHECK(dups_of(db.dbi, txn, 40).collect().empty());
  CHECK(dups_of(db.dbi, txn, ID_MAX).collect().empty());
  mdb_txn_abort(txn);
}

TEST_CASE("stop at to_key", "[iter]") {
  TempDB db(ID_SET);
  fill(db);
  MDB_txn* txn;
  REQUIRE(!mdb_txn_begin(db.env, nullptr, MDB_RDONLY, &txn));
  vector<uint64_t> xs;
  for (auto n : DBIter(db.dbi, txn, Dir::Asc, {}, Cursor(30))) xs.push_back(n);
  CHECK(xs == vector<uint64_t>{101, 103, 205});
  xs.clear();
  for (auto n : DBIter(db.dbi, txn, Dir::Asc, Cursor(15), Cursor(25))) xs.push_back(n);
  CHECK(xs == vector<uint64_t>{205});
  xs.clear();
  for (auto n : DBIter(db.dbi, txn, Dir::Desc, Cursor(30), Cursor(10))) xs.push_back(n);
  CHECK(xs == vector<uint64_t>{309, 305, 301, 205});
  mdb_txn_abort(txn);
}

TEST_CASE("iterate over multi-part keys", "[iter]") {
  TempDB db(MDB_DUPSORT);
  MDB_txn* txn;
  REQUIRE(!mdb_txn_begin(db.env, nullptr, 0, &txn));
  db_put(txn, db.dbi, Cursor(1000020, 3000000), 1);
  db_put(txn, db.dbi, Cursor(1000020, 2000000), 2);
  db_put(txn, db.dbi, Cursor(2000010, 1000000), 3);
  REQUIRE(!mdb_txn_commit(txn));

  REQUIRE(!mdb_txn_begin(db.env, nullptr, MDB_RDONLY, &txn));
  vector<uint64_t> ints;
  for (auto i : DBIter(db.dbi, txn, Dir::Asc)) ints.push_back(i);
  CHECK(ints == vector<uint64_t>{2, 1, 3});
  ints.clear();
  for (auto i : DBIter(db.dbi, txn, Dir::Asc, Cursor(1000020, 0), Cursor(1000020, ID_MAX))) ints.push_back(i);
  CHECK(ints == vector<uint64_t>{2, 1});
  mdb_txn_abort(txn);
}

TEST_CASE("Cursor keeps both fields", "[iter]") {
  Cursor single(0xabc), two(0x12, 0x34);
  CHECK(single.int_field_0() == 0xabc);
  CHECK(two.int_field_0() == 0x12);
  CHECK(two.int_field_1() == 0x34);
  CHECK(Cursor(two.val()).int_field_1() == 0x34);
  CHECK(two.to_string() == "Cursor(12,34)");
}
