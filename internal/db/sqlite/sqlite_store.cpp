#include "sqlite_store.hpp"

#include <sqlite3.h>

#include <optional>
#include <stdexcept>

#include "sqlite_batch_writer.hpp"

namespace replication::db::sqlite {

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StatementPtr PrepareStatement(sqlite3* db, const char* sql, int* rc) {
  sqlite3_stmt* st = nullptr;
  *rc              = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
  return StatementPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  // zero-length blobs must not bind as NULL
  sqlite3_bind_blob(st, idx, s.empty() ? "" : s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* b = sqlite3_column_blob(st, col);
  int         n = sqlite3_column_bytes(st, col);
  return b ? std::string(static_cast<const char*>(b), static_cast<std::size_t>(n)) : "";
}

} // namespace

SqliteStore::SqliteStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteStore::Bootstrap() {
  std::scoped_lock lock(mutex_);
  db_->Exec("CREATE TABLE IF NOT EXISTS store_tables (name TEXT PRIMARY KEY);");
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS store_properties (tbl TEXT NOT NULL, prop_key TEXT NOT NULL, prop_value TEXT NOT NULL, "
      "PRIMARY KEY (tbl, prop_key));");
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS store_entries (tbl TEXT NOT NULL, row_key BLOB NOT NULL, family BLOB NOT NULL, "
      "qualifier BLOB NOT NULL, value BLOB NOT NULL, PRIMARY KEY (tbl, row_key, family, qualifier)) WITHOUT ROWID;");
}

Result SqliteStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::Rejected, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::Unavailable, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

bool SqliteStore::TableExistsLocked(const std::string& table) {
  int  rc = SQLITE_OK;
  auto st = PrepareStatement(db_->Handle(), "SELECT 1 FROM store_tables WHERE name=?;", &rc);
  if (rc != SQLITE_OK) return false;
  BindText(st.get(), 1, table);
  return sqlite3_step(st.get()) == SQLITE_ROW;
}

bool SqliteStore::TableExists(const std::string& table) {
  std::scoped_lock lock(mutex_);
  return TableExistsLocked(table);
}

Result SqliteStore::CreateTable(const std::string& table) {
  std::scoped_lock lock(mutex_);
  if (TableExistsLocked(table)) return Result::Err(ErrorCode::AlreadyExists, table);

  int  rc = SQLITE_OK;
  auto st = PrepareStatement(db_->Handle(), "INSERT INTO store_tables(name) VALUES(?);", &rc);
  if (rc != SQLITE_OK) return Translate(db_->Handle(), rc);
  BindText(st.get(), 1, table);
  return Translate(db_->Handle(), sqlite3_step(st.get()));
}

std::vector<std::string> SqliteStore::ListCombiners(const std::string& table) {
  std::scoped_lock         lock(mutex_);
  std::vector<std::string> names;
  auto                     it = combiners_.find(table);
  if (it == combiners_.end()) return names;
  for (const auto& setting : it->second) {
    names.push_back(setting.name);
  }
  return names;
}

Result SqliteStore::AttachCombiner(const std::string& table, const CombinerSetting& setting) {
  if (!setting.combiner) return Result::Err(ErrorCode::InternalError, "combiner '" + setting.name + "' has no implementation");

  std::scoped_lock lock(mutex_);
  if (!TableExistsLocked(table)) return Result::Err(ErrorCode::NotFound, table);

  auto& settings = combiners_[table];
  for (auto& existing : settings) {
    if (existing.name == setting.name) {
      existing = setting;
      return Result::Ok();
    }
  }
  settings.push_back(setting);
  return Result::Ok();
}

Result SqliteStore::SetTableProperty(const std::string& table, const std::string& key, const std::string& value) {
  std::scoped_lock lock(mutex_);
  if (!TableExistsLocked(table)) return Result::Err(ErrorCode::NotFound, table);

  int  rc = SQLITE_OK;
  auto st = PrepareStatement(db_->Handle(),
                             "INSERT INTO store_properties(tbl,prop_key,prop_value) VALUES(?,?,?) "
                             "ON CONFLICT(tbl,prop_key) DO UPDATE SET prop_value=excluded.prop_value;",
                             &rc);
  if (rc != SQLITE_OK) return Translate(db_->Handle(), rc);
  BindText(st.get(), 1, table);
  BindText(st.get(), 2, key);
  BindText(st.get(), 3, value);
  return Translate(db_->Handle(), sqlite3_step(st.get()));
}

Result SqliteStore::GetTableProperties(const std::string& table, const std::string& prefix, std::map<std::string, std::string>* out) {
  std::scoped_lock lock(mutex_);
  if (!TableExistsLocked(table)) return Result::Err(ErrorCode::NotFound, table);

  int  rc = SQLITE_OK;
  auto st = PrepareStatement(db_->Handle(), "SELECT prop_key,prop_value FROM store_properties WHERE tbl=? ORDER BY prop_key;", &rc);
  if (rc != SQLITE_OK) return Translate(db_->Handle(), rc);
  BindText(st.get(), 1, table);

  out->clear();
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    auto key = ColText(st.get(), 0);
    if (key.compare(0, prefix.size(), prefix) != 0) continue;
    out->emplace(std::move(key), ColText(st.get(), 1));
  }
  return Translate(db_->Handle(), rc);
}

Result SqliteStore::Scan(const std::string& table, const ScanOptions& options, std::vector<Entry>* out) {
  std::scoped_lock lock(mutex_);
  if (!TableExistsLocked(table)) return Result::Err(ErrorCode::NotFound, table);

  std::string sql = "SELECT row_key,family,qualifier,value FROM store_entries WHERE tbl=?";
  if (options.range.start_row) sql += " AND row_key>=?";
  if (options.range.end_row) sql += " AND row_key<?";
  sql += " ORDER BY row_key,family,qualifier;";

  int  rc = SQLITE_OK;
  auto st = PrepareStatement(db_->Handle(), sql.c_str(), &rc);
  if (rc != SQLITE_OK) return Translate(db_->Handle(), rc);

  int idx = 1;
  BindText(st.get(), idx++, table);
  if (options.range.start_row) BindBlob(st.get(), idx++, *options.range.start_row);
  if (options.range.end_row) BindBlob(st.get(), idx++, *options.range.end_row);

  out->clear();
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    Entry entry;
    entry.key.family = ColBlob(st.get(), 1);
    if (!options.AcceptsFamily(entry.key.family)) continue;
    entry.key.row       = ColBlob(st.get(), 0);
    entry.key.qualifier = ColBlob(st.get(), 2);
    entry.value         = ColBlob(st.get(), 3);
    out->push_back(std::move(entry));
  }
  return Translate(db_->Handle(), rc);
}

Result SqliteStore::CreateBatchWriter(const std::string& table, std::unique_ptr<BatchWriter>* out) {
  if (!TableExists(table)) return Result::Err(ErrorCode::NotFound, table);
  *out = std::make_unique<SqliteBatchWriter>(*this, table);
  return Result::Ok();
}

Result SqliteStore::Apply(const std::string& table, const std::vector<Mutation>& mutations) {
  std::scoped_lock lock(mutex_);
  if (!TableExistsLocked(table)) return Result::Err(ErrorCode::Rejected, "table '" + table + "' no longer exists");

  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::Busy, e.what());
  }

  auto result = ApplyLocked(table, mutations);
  try {
    db_->Exec(result ? "COMMIT;" : "ROLLBACK;");
  } catch (const std::exception& e) {
    if (result) {
      try {
        db_->Exec("ROLLBACK;");
      } catch (const std::exception& rollback_error) {
        return Result::Err(ErrorCode::InternalError, std::string(e.what()) + "; rollback: " + rollback_error.what());
      }
      return Result::Err(ErrorCode::Rejected, e.what());
    }
  }
  return result;
}

Result SqliteStore::ApplyLocked(const std::string& table, const std::vector<Mutation>& mutations) {
  auto* db = db_->Handle();
  int   rc = SQLITE_OK;

  auto select = PrepareStatement(db, "SELECT value FROM store_entries WHERE tbl=? AND row_key=? AND family=? AND qualifier=?;", &rc);
  if (rc != SQLITE_OK) return Translate(db, rc);
  auto upsert = PrepareStatement(db,
                                 "INSERT INTO store_entries(tbl,row_key,family,qualifier,value) VALUES(?,?,?,?,?) "
                                 "ON CONFLICT(tbl,row_key,family,qualifier) DO UPDATE SET value=excluded.value;",
                                 &rc);
  if (rc != SQLITE_OK) return Translate(db, rc);
  auto erase = PrepareStatement(db, "DELETE FROM store_entries WHERE tbl=? AND row_key=? AND family=? AND qualifier=?;", &rc);
  if (rc != SQLITE_OK) return Translate(db, rc);

  const auto  found    = combiners_.find(table);
  const auto* settings = found == combiners_.end() ? nullptr : &found->second;

  for (const auto& mutation : mutations) {
    for (const auto& update : mutation.Updates()) {
      if (update.deleted) {
        sqlite3_reset(erase.get());
        BindText(erase.get(), 1, table);
        BindBlob(erase.get(), 2, mutation.Row());
        BindBlob(erase.get(), 3, update.family);
        BindBlob(erase.get(), 4, update.qualifier);
        if (auto r = Translate(db, sqlite3_step(erase.get())); !r) return r;
        continue;
      }

      std::string value = update.value;
      if (settings) {
        sqlite3_reset(select.get());
        BindText(select.get(), 1, table);
        BindBlob(select.get(), 2, mutation.Row());
        BindBlob(select.get(), 3, update.family);
        BindBlob(select.get(), 4, update.qualifier);

        std::optional<std::string> existing;
        rc = sqlite3_step(select.get());
        if (rc == SQLITE_ROW) {
          existing = ColBlob(select.get(), 0);
        } else if (rc != SQLITE_DONE) {
          return Translate(db, rc);
        }

        if (existing) {
          bool combined = false;
          for (const auto& setting : *settings) {
            if (!setting.AppliesTo(update.family)) continue;
            std::string out;
            auto        r = setting.combiner->Combine(combined ? value : *existing, update.value, &out);
            if (!r) {
              return Result::Err(ErrorCode::Rejected, "combiner '" + setting.name + "' failed for row '" + mutation.Row() + "': " + r.message);
            }
            value    = std::move(out);
            combined = true;
          }
        }
      }

      sqlite3_reset(upsert.get());
      BindText(upsert.get(), 1, table);
      BindBlob(upsert.get(), 2, mutation.Row());
      BindBlob(upsert.get(), 3, update.family);
      BindBlob(upsert.get(), 4, update.qualifier);
      BindBlob(upsert.get(), 5, value);
      if (auto r = Translate(db, sqlite3_step(upsert.get())); !r) return r;
    }
  }
  return Result::Ok();
}

} // namespace replication::db::sqlite
