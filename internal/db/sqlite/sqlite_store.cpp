#include "sqlite_store.hpp"

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "sqlite_tx.hpp"

namespace keysync::db::sqlite {

// 64-bit binds: sqlite reports SQLITE_TOOBIG instead of a wrapped length
static void BindText(SqliteDB& db, sqlite3_stmt* st, int idx, const std::string& s) {
    db.Check(sqlite3_bind_text64(st, idx, s.c_str(), static_cast<sqlite3_uint64>(s.size()), SQLITE_TRANSIENT, SQLITE_UTF8),
             "bind text");
}

static void BindBlob(SqliteDB& db, sqlite3_stmt* st, int idx, const std::string& b) {
    db.Check(sqlite3_bind_blob64(st, idx, b.data(), static_cast<sqlite3_uint64>(b.size()), SQLITE_TRANSIENT), "bind blob");
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st, col)) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* b = sqlite3_column_blob(st, col);
    return b ? std::string(static_cast<const char*>(b), sqlite3_column_bytes(st, col)) : "";
}

SqliteStore::SqliteStore(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

// ------------------------------------------------------------------
// Schema / seed
// ------------------------------------------------------------------

void SqliteStore::EnsureSchema() {
    sql::RunMigrations(*db_, sql::StoreSchema());
}

std::size_t SqliteStore::SeedDefaults() {
    SqliteTransaction tx(db_);

    std::size_t inserted = 0;
    for (const auto& kv : model::DefaultConfig()) {
        if (ConfigKeyCount(kv.key) != 0)
            continue;

        auto st = db_->Prepare(sql::INSERT_CONFIG);
        BindText(*db_, st.get(), 1, kv.key);
        BindText(*db_, st.get(), 2, kv.value);
        db_->Check(sqlite3_step(st.get()), "insert config");
        ++inserted;
    }

    tx.Commit();

    if (inserted > 0) {
        KEYSYNC_LOG_DEBUG("seeded config", {observability::IntField("rows", static_cast<std::int64_t>(inserted))});
    }
    return inserted;
}

// ------------------------------------------------------------------
// Metadata
// ------------------------------------------------------------------

std::int64_t SqliteStore::MetadataCount() {
    return QueryCount(sql::COUNT_METADATA, nullptr, "count metadata");
}

void SqliteStore::InsertMetadata(const std::string& data) {
    auto st = db_->Prepare(sql::INSERT_METADATA);
    BindBlob(*db_, st.get(), 1, data);
    db_->Check(sqlite3_step(st.get()), "insert metadata");
}

std::optional<std::string> SqliteStore::GetMetadata() {
    auto st = db_->Prepare(sql::SELECT_METADATA);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE)
        return std::nullopt;
    db_->Check(rc, "select metadata");

    return ColBlob(st.get(), 0);
}

// ------------------------------------------------------------------
// Revision
// ------------------------------------------------------------------

void SqliteStore::UpsertRevision(const model::RevisionRecord& r) {
    auto st = db_->Prepare(sql::UPSERT_REVISION);
    BindText(*db_, st.get(), 1, r.revision_id);
    BindBlob(*db_, st.get(), 2, r.data);
    db_->Check(sqlite3_step(st.get()), "upsert revision");
}

std::optional<model::RevisionRecord>
SqliteStore::GetRevision(const std::string& revision_id) {
    auto st = db_->Prepare(sql::SELECT_REVISION);
    BindText(*db_, st.get(), 1, revision_id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE)
        return std::nullopt;
    db_->Check(rc, "select revision");

    model::RevisionRecord r;
    r.revision_id = ColText(st.get(), 0);
    r.data = ColBlob(st.get(), 1);
    return r;
}

std::int64_t SqliteStore::RevisionCount() {
    return QueryCount(sql::COUNT_REVISION, nullptr, "count revision");
}

// ------------------------------------------------------------------
// Config
// ------------------------------------------------------------------

std::int64_t SqliteStore::ConfigKeyCount(const std::string& key) {
    return QueryCount(sql::COUNT_CONFIG_KEY, &key, "count config");
}

std::optional<std::string> SqliteStore::GetConfigValue(const std::string& key) {
    auto st = db_->Prepare(sql::SELECT_CONFIG_VALUE);
    BindText(*db_, st.get(), 1, key);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE)
        return std::nullopt;
    db_->Check(rc, "select config");

    return ColText(st.get(), 0);
}

std::vector<model::ConfigRecord> SqliteStore::ListConfig() {
    auto st = db_->Prepare(sql::SELECT_CONFIG);

    std::vector<model::ConfigRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back({ColText(st.get(), 0), ColText(st.get(), 1)});
    }
    db_->Check(rc, "list config");
    return out;
}

std::int64_t SqliteStore::QueryCount(const char* sql, const std::string* key, const char* what) {
    auto st = db_->Prepare(sql);
    if (key)
        BindText(*db_, st.get(), 1, *key);

    int rc = sqlite3_step(st.get());
    db_->Check(rc, what);
    if (rc != SQLITE_ROW)
        return 0;
    return sqlite3_column_int64(st.get(), 0);
}

}
