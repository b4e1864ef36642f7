#include "internal/db/sqlite/sqlite_store.hpp"

#include <cassert>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/config_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/util/errors.hpp"

namespace {

using keysync::db::model::DefaultConfig;
using keysync::db::model::RevisionRecord;
using keysync::db::sqlite::SqliteDB;
using keysync::db::sqlite::SqliteStore;
using keysync::db::sqlite::SqliteTransaction;
using keysync::util::StoreError;

std::filesystem::path FreshDbPath(const std::string& test_name) {
  const auto base_dir = std::filesystem::temp_directory_path() / "keysync_sqlite_store_tests";
  std::filesystem::create_directories(base_dir);

  const auto path = base_dir / (test_name + ".sqlite3");
  std::filesystem::remove(path);
  return path;
}

std::shared_ptr<SqliteDB> Open(const std::filesystem::path& path) {
  return std::make_shared<SqliteDB>(path.string());
}

std::string QueryText(SqliteDB& db, const std::string& sql) {
  auto st = db.Prepare(sql);
  int  rc = sqlite3_step(st.get());
  assert(rc == SQLITE_ROW);
  const unsigned char* text = sqlite3_column_text(st.get(), 0);
  return text ? reinterpret_cast<const char*>(text) : "";
}

struct Column {
  std::string name;
  std::string type;
  bool        not_null;
  int         pk;
};

std::vector<Column> TableInfo(SqliteDB& db, const std::string& table) {
  auto                st = db.Prepare("PRAGMA table_info(" + table + ");");
  std::vector<Column> columns;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    columns.push_back({reinterpret_cast<const char*>(sqlite3_column_text(st.get(), 1)),
                       reinterpret_cast<const char*>(sqlite3_column_text(st.get(), 2)),
                       sqlite3_column_int(st.get(), 3) != 0, sqlite3_column_int(st.get(), 5)});
  }
  return columns;
}

void ExpectColumns(SqliteDB& db, const std::string& table, const std::vector<Column>& expected) {
  const auto actual = TableInfo(db, table);
  assert(actual.size() == expected.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    assert(actual[i].name == expected[i].name);
    assert(actual[i].type == expected[i].type);
    assert(actual[i].not_null == expected[i].not_null);
    assert(actual[i].pk == expected[i].pk);
  }
}

void TestSchemaMatchesDesktopApplication() {
  const auto path = FreshDbPath("schema");
  auto       db   = Open(path);
  SqliteStore store(db);
  store.EnsureSchema();

  ExpectColumns(*db, "config", {{"key", "TEXT", false, 0}, {"value", "TEXT", false, 0}});
  ExpectColumns(*db, "metadata", {{"data", "BLOB", false, 0}});
  ExpectColumns(*db, "heatmap",
                {{"revisionId", "TEXT", true, 0}, {"enabled", "boolean", false, 0}, {"data", "BLOB", false, 0}});
  ExpectColumns(*db, "revision", {{"revisionId", "TEXT", true, 0}, {"data", "BLOB", false, 0}});
  ExpectColumns(*db, "smart_layer",
                {{"id", "INTEGER", false, 1},
                 {"app", "TEXT", true, 0},
                 {"layer", "INTEGER", true, 0},
                 {"layoutId", "TEXT", true, 0},
                 {"revisionId", "TEXT", true, 0}});
  ExpectColumns(*db, "auth", {{"token", "TEXT", true, 0}, {"username", "TEXT", true, 0}});

  assert(QueryText(*db, "SELECT count(*) FROM sqlite_master WHERE type='table' AND name IN "
                        "('config','metadata','heatmap','revision','smart_layer','auth');") == "6");
}

void TestSchemaIsIdempotentAndKeepsContent() {
  const auto path = FreshDbPath("schema_idempotent");
  auto       db   = Open(path);

  // a store where only some tables exist and already hold data
  db->Exec("CREATE TABLE \"config\" (key TEXT, value TEXT);");
  db->Exec("INSERT INTO config (key, value) VALUES ('theme', 'dark');");
  db->Exec("CREATE TABLE \"auth\" (token TEXT NOT NULL UNIQUE, username TEXT NOT NULL);");
  db->Exec("INSERT INTO auth (token, username) VALUES ('t0k3n', 'someone');");

  SqliteStore store(db);
  store.EnsureSchema();
  store.EnsureSchema();

  assert(store.GetConfigValue("theme") == std::optional<std::string>("dark"));
  assert(QueryText(*db, "SELECT username FROM auth WHERE token='t0k3n';") == "someone");
  assert(TableInfo(*db, "smart_layer").size() == 5);
}

void TestSeedingTwiceYieldsSevenRows() {
  const auto path = FreshDbPath("seed_twice");
  auto       db   = Open(path);
  SqliteStore store(db);
  store.EnsureSchema();

  assert(store.SeedDefaults() == 7);
  assert(store.SeedDefaults() == 0);

  const auto rows = store.ListConfig();
  assert(rows.size() == 7);
  for (size_t i = 0; i < rows.size(); ++i) {
    assert(rows[i].key == DefaultConfig()[i].key);
    assert(rows[i].value == DefaultConfig()[i].value);
  }
  assert(store.GetConfigValue("api_port") == std::optional<std::string>("50051"));
}

void TestSeedingNeverOverwritesConsumerValues() {
  const auto path = FreshDbPath("seed_keeps_values");
  {
    auto        db = Open(path);
    SqliteStore store(db);
    store.EnsureSchema();
    store.SeedDefaults();

    // the desktop application flips a setting between runs
    db->Exec("UPDATE config SET value='1' WHERE key='update_check';");
  }

  auto        db = Open(path);
  SqliteStore store(db);
  store.EnsureSchema();
  assert(store.SeedDefaults() == 0);
  assert(store.GetConfigValue("update_check") == std::optional<std::string>("1"));
  assert(store.ListConfig().size() == 7);
}

void TestSeedingFillsOnlyMissingKeys() {
  const auto path = FreshDbPath("seed_missing");
  auto       db   = Open(path);
  SqliteStore store(db);
  store.EnsureSchema();

  db->Exec("INSERT INTO config (key, value) VALUES ('api_enabled', '1');");
  db->Exec("INSERT INTO config (key, value) VALUES ('custom_key', 'x');");

  assert(store.SeedDefaults() == 6);
  assert(store.ListConfig().size() == 8);
  assert(store.ConfigKeyCount("api_enabled") == 1);
  assert(store.GetConfigValue("api_enabled") == std::optional<std::string>("1"));
}

void TestUpsertRevisionReplacesData() {
  const auto path = FreshDbPath("upsert_revision");
  auto       db   = Open(path);
  SqliteStore store(db);
  store.EnsureSchema();

  store.UpsertRevision(RevisionRecord{"rev1", R"({"v":1})"});
  store.UpsertRevision(RevisionRecord{"rev1", R"({"v":2})"});
  store.UpsertRevision(RevisionRecord{"rev2", R"({"v":3})"});

  assert(store.RevisionCount() == 2);
  assert(QueryText(*db, "SELECT count(*) FROM revision WHERE revisionId='rev1';") == "1");

  const auto rev1 = store.GetRevision("rev1");
  assert(rev1.has_value());
  assert(rev1->data == R"({"v":2})");
  assert(QueryText(*db, "SELECT typeof(data) FROM revision WHERE revisionId='rev1';") == "blob");

  assert(!store.GetRevision("missing").has_value());
}

void TestMetadataInsertAndCount() {
  const auto path = FreshDbPath("metadata");
  auto       db   = Open(path);
  SqliteStore store(db);
  store.EnsureSchema();

  assert(store.MetadataCount() == 0);
  assert(!store.GetMetadata().has_value());

  const std::string blob("meta\0data\xff", 10);
  store.InsertMetadata(blob);

  assert(store.MetadataCount() == 1);
  assert(store.GetMetadata() == std::optional<std::string>(blob));
  assert(QueryText(*db, "SELECT typeof(data) FROM metadata;") == "blob");
}

void TestTransactionRollsBackWhenNotCommitted() {
  const auto path = FreshDbPath("rollback");
  auto       db   = Open(path);
  SqliteStore store(db);
  store.EnsureSchema();

  {
    SqliteTransaction tx(db);
    db->Exec("INSERT INTO config (key, value) VALUES ('k', 'v');");
  }
  assert(store.ConfigKeyCount("k") == 0);

  {
    SqliteTransaction tx(db);
    db->Exec("INSERT INTO config (key, value) VALUES ('k', 'v');");
    tx.Commit();
  }
  assert(store.ConfigKeyCount("k") == 1);

  // a failing statement unwinds through the transaction
  bool threw = false;
  try {
    SqliteTransaction tx(db);
    db->Exec("INSERT INTO config (key, value) VALUES ('k2', 'v');");
    db->Exec("INSERT INTO no_such_table VALUES (1);");
    tx.Commit();
  } catch (const StoreError&) {
    threw = true;
  }
  assert(threw);
  assert(store.ConfigKeyCount("k2") == 0);
}

void TestBusyTimeoutIsClampedToInt() {
  const auto path = FreshDbPath("busy_timeout");

  auto huge = std::make_shared<SqliteDB>(path.string(),
                                         keysync::db::sqlite::SqliteOptions{std::numeric_limits<std::uint32_t>::max()});
  assert(QueryText(*huge, "PRAGMA busy_timeout;") == std::to_string(std::numeric_limits<int>::max()));

  auto small = std::make_shared<SqliteDB>(path.string(), keysync::db::sqlite::SqliteOptions{250});
  assert(QueryText(*small, "PRAGMA busy_timeout;") == "250");
}

void TestOversizedValuesThrowStoreError() {
  const auto path = FreshDbPath("oversized");
  auto       db   = Open(path);
  SqliteStore store(db);
  store.EnsureSchema();

  sqlite3_limit(db->Handle(), SQLITE_LIMIT_LENGTH, 16);
  const std::string big(64, 'x');

  bool threw = false;
  try {
    store.InsertMetadata(big);
  } catch (const StoreError& e) {
    threw = std::string(e.what()).find("bind blob") != std::string::npos;
  }
  assert(threw);

  threw = false;
  try {
    store.UpsertRevision(RevisionRecord{big, "{}"});
  } catch (const StoreError& e) {
    threw = std::string(e.what()).find("bind text") != std::string::npos;
  }
  assert(threw);

  assert(store.MetadataCount() == 0);
  assert(store.RevisionCount() == 0);
}

void TestOpenFailsWithoutParentDirectory() {
  const auto path = std::filesystem::temp_directory_path() / "keysync_sqlite_store_tests" / "no" / "such" / "dir" /
                    "keymapp.sqlite3";
  std::filesystem::remove_all(path.parent_path());

  bool threw = false;
  try {
    (void)Open(path);
  } catch (const StoreError&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(path));
}

void TestStatementErrorsThrowStoreError() {
  const auto path = FreshDbPath("statement_error");
  auto       db   = Open(path);
  SqliteStore store(db);

  // schema not applied yet
  bool threw = false;
  try {
    (void)store.MetadataCount();
  } catch (const StoreError& e) {
    threw = std::string(e.what()).find("metadata") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSchemaMatchesDesktopApplication();
  TestSchemaIsIdempotentAndKeepsContent();
  TestSeedingTwiceYieldsSevenRows();
  TestSeedingNeverOverwritesConsumerValues();
  TestSeedingFillsOnlyMissingKeys();
  TestUpsertRevisionReplacesData();
  TestMetadataInsertAndCount();
  TestTransactionRollsBackWhenNotCommitted();
  TestBusyTimeoutIsClampedToInt();
  TestOversizedValuesThrowStoreError();
  TestOpenFailsWithoutParentDirectory();
  TestStatementErrorsThrowStoreError();

  std::cout << "keysync_unit_sqlite_store: pass\n";
  return 0;
}
