#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace asyncquery::db::sqlite {

using asyncquery::db::ErrorCode;
using asyncquery::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      stmt_ = nullptr;
    }
  }

  ~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const {
    return stmt_ != nullptr;
  }

  sqlite3_stmt* get() const {
    return stmt_;
  }

  // Reads fail loudly; a prepare error means the schema is wrong.
  sqlite3_stmt* Require() const {
    if (!stmt_) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
    return stmt_;
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* stmt_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::SessionRecord ReadSession(sqlite3_stmt* st) {
  model::SessionRecord r;
  r.session_id        = ColText(st, 0);
  r.datasource        = ColText(st, 1);
  r.application_id    = ColText(st, 2);
  r.job_id            = ColText(st, 3);
  r.state             = static_cast<asyncquery::v1::SessionState>(ColI32(st, 4));
  r.created_at_ms     = ColU64(st, 5);
  r.last_heartbeat_ms = ColU64(st, 6);
  return r;
}

model::StatementRecord ReadStatement(sqlite3_stmt* st) {
  model::StatementRecord r;
  r.statement_id   = ColText(st, 0);
  r.session_id     = ColText(st, 1);
  r.sequence       = ColU64(st, 2);
  r.lang_type      = static_cast<asyncquery::v1::LangType>(ColI32(st, 3));
  r.query          = ColText(st, 4);
  r.state          = static_cast<asyncquery::v1::StatementState>(ColI32(st, 5));
  r.error          = ColText(st, 6);
  r.result_index   = ColText(st, 7);
  r.submit_time_ms = ColU64(st, 8);
  r.updated_at_ms  = ColU64(st, 9);
  return r;
}

model::QueryResultRecord ReadQueryResult(sqlite3_stmt* st) {
  model::QueryResultRecord r;
  r.result_index  = ColText(st, 0);
  r.job_id        = ColText(st, 1);
  r.query_id      = ColText(st, 2);
  r.document_json = ColText(st, 3);
  r.written_at_ms = ColU64(st, 4);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_SESSION);
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.session_id);
  BindText(st.get(), 2, r.datasource);
  BindText(st.get(), 3, r.application_id);
  BindText(st.get(), 4, r.job_id);
  BindI32(st.get(), 5, static_cast<int>(r.state));
  BindU64(st.get(), 6, r.created_at_ms);
  BindU64(st.get(), 7, r.last_heartbeat_ms);

  const int rc = sqlite3_step(st.get());
  if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, r.session_id);
  return Translate(db, rc);
}

std::optional<model::SessionRecord> SqliteRepository::GetSession(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), sql::SELECT_SESSION);
  BindText(st.Require(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadSession(st.get());
}

std::vector<model::SessionRecord> SqliteRepository::ListSessions(Transaction& t) {
  Statement                         st(TX(t).Handle(), sql::LIST_SESSIONS);
  std::vector<model::SessionRecord> out;
  while (sqlite3_step(st.Require()) == SQLITE_ROW) {
    out.push_back(ReadSession(st.get()));
  }
  return out;
}

Result SqliteRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_SESSION);
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.datasource);
  BindText(st.get(), 2, r.application_id);
  BindText(st.get(), 3, r.job_id);
  BindI32(st.get(), 4, static_cast<int>(r.state));
  BindU64(st.get(), 5, r.created_at_ms);
  BindU64(st.get(), 6, r.last_heartbeat_ms);
  BindText(st.get(), 7, r.session_id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.session_id);
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Statements
// ------------------------------------------------------------------

Result SqliteRepository::InsertStatement(Transaction& t, const model::StatementRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_STATEMENT);
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.statement_id);
  BindText(st.get(), 2, r.session_id);
  BindU64(st.get(), 3, r.sequence);
  BindI32(st.get(), 4, static_cast<int>(r.lang_type));
  BindText(st.get(), 5, r.query);
  BindI32(st.get(), 6, static_cast<int>(r.state));
  BindText(st.get(), 7, r.error);
  BindText(st.get(), 8, r.result_index);
  BindU64(st.get(), 9, r.submit_time_ms);
  BindU64(st.get(), 10, r.updated_at_ms);

  const int rc = sqlite3_step(st.get());
  if ((rc & 0xff) == SQLITE_CONSTRAINT && sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) return Result::Err(ErrorCode::AlreadyExists, r.statement_id);
  return Translate(db, rc);
}

std::optional<model::StatementRecord> SqliteRepository::GetStatement(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), sql::SELECT_STATEMENT);
  BindText(st.Require(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadStatement(st.get());
}

std::vector<model::StatementRecord> SqliteRepository::ListStatements(Transaction& t, const std::string& session_id) {
  Statement st(TX(t).Handle(), sql::LIST_STATEMENTS);
  BindText(st.Require(), 1, session_id);

  std::vector<model::StatementRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadStatement(st.get()));
  }
  return out;
}

Result SqliteRepository::UpdateStatement(Transaction& t, const model::StatementRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_STATEMENT);
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.session_id);
  BindU64(st.get(), 2, r.sequence);
  BindI32(st.get(), 3, static_cast<int>(r.lang_type));
  BindText(st.get(), 4, r.query);
  BindI32(st.get(), 5, static_cast<int>(r.state));
  BindText(st.get(), 6, r.error);
  BindText(st.get(), 7, r.result_index);
  BindU64(st.get(), 8, r.submit_time_ms);
  BindU64(st.get(), 9, r.updated_at_ms);
  BindText(st.get(), 10, r.statement_id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.statement_id);
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Job metadata
// ------------------------------------------------------------------

Result SqliteRepository::InsertJobMetadata(Transaction& t, const model::JobMetadataRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_JOB_METADATA);
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.query_id);
  BindText(st.get(), 2, r.application_id);
  BindText(st.get(), 3, r.job_id);
  BindI32(st.get(), 4, r.is_drop_index_op ? 1 : 0);
  BindText(st.get(), 5, r.result_index);
  BindText(st.get(), 6, r.session_id);
  BindText(st.get(), 7, r.datasource);
  BindU64(st.get(), 8, r.created_at_ms);

  const int rc = sqlite3_step(st.get());
  if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, r.query_id);
  return Translate(db, rc);
}

std::optional<model::JobMetadataRecord> SqliteRepository::GetJobMetadata(Transaction& t, const std::string& query_id) {
  Statement st(TX(t).Handle(), sql::SELECT_JOB_METADATA);
  BindText(st.Require(), 1, query_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::JobMetadataRecord r;
  r.query_id         = ColText(st.get(), 0);
  r.application_id   = ColText(st.get(), 1);
  r.job_id           = ColText(st.get(), 2);
  r.is_drop_index_op = ColI32(st.get(), 3) != 0;
  r.result_index     = ColText(st.get(), 4);
  r.session_id       = ColText(st.get(), 5);
  r.datasource       = ColText(st.get(), 6);
  r.created_at_ms    = ColU64(st.get(), 7);
  return r;
}

// ------------------------------------------------------------------
// Results
// ------------------------------------------------------------------

Result SqliteRepository::UpsertQueryResult(Transaction& t, const model::QueryResultRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_QUERY_RESULT);
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.result_index);
  BindText(st.get(), 2, r.job_id);
  BindText(st.get(), 3, r.query_id);
  BindText(st.get(), 4, r.document_json);
  BindU64(st.get(), 5, r.written_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::QueryResultRecord> SqliteRepository::GetResultByJobId(Transaction& t, const std::string& job_id,
                                                                           const std::string& result_index) {
  Statement st(TX(t).Handle(), sql::SELECT_RESULT_BY_JOB_ID);
  BindText(st.Require(), 1, job_id);
  BindText(st.get(), 2, result_index);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadQueryResult(st.get());
}

std::optional<model::QueryResultRecord> SqliteRepository::GetResultByQueryId(Transaction& t, const std::string& query_id,
                                                                             const std::string& result_index) {
  Statement st(TX(t).Handle(), sql::SELECT_RESULT_BY_QUERY_ID);
  BindText(st.Require(), 1, query_id);
  BindText(st.get(), 2, result_index);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadQueryResult(st.get());
}

// ------------------------------------------------------------------
// Index metadata
// ------------------------------------------------------------------

Result SqliteRepository::UpsertIndexMetadata(Transaction& t, const model::IndexMetadataRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_INDEX_METADATA);
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.index_name);
  BindText(st.get(), 2, r.datasource);
  BindText(st.get(), 3, r.job_id);
  BindText(st.get(), 4, r.application_id);
  BindI32(st.get(), 5, r.auto_refresh ? 1 : 0);
  BindU64(st.get(), 6, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::IndexMetadataRecord> SqliteRepository::GetIndexMetadata(Transaction& t, const std::string& index_name) {
  Statement st(TX(t).Handle(), sql::SELECT_INDEX_METADATA);
  BindText(st.Require(), 1, index_name);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::IndexMetadataRecord r;
  r.index_name     = ColText(st.get(), 0);
  r.datasource     = ColText(st.get(), 1);
  r.job_id         = ColText(st.get(), 2);
  r.application_id = ColText(st.get(), 3);
  r.auto_refresh   = ColI32(st.get(), 4) != 0;
  r.updated_at_ms  = ColU64(st.get(), 5);
  return r;
}

Result SqliteRepository::DeleteIndexMetadata(Transaction& t, const std::string& index_name) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_INDEX_METADATA);
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, index_name);
  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, index_name);
  return Translate(db, rc);
}

} // namespace asyncquery::db::sqlite
