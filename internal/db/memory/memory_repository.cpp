#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace asyncquery::db::memory {

namespace {

std::string ResultKey(const model::QueryResultRecord& r) {
  return r.result_index + "#" + r.job_id + "#" + r.query_id;
}

template <typename Map>
auto Find(const Map& map, const std::string& key) -> std::optional<typename Map::mapped_type> {
  auto it = map.find(key);
  if (it == map.end()) return std::nullopt;
  return it->second;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result MemoryRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  if (TX(t).View().sessions.contains(r.session_id)) return Result::Err(ErrorCode::AlreadyExists, r.session_id);
  TX(t).Mutable(Table::kSessions, r.session_id).sessions[r.session_id] = r;
  return Result::Ok();
}

std::optional<model::SessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& id) {
  return Find(TX(t).View().sessions, id);
}

std::vector<model::SessionRecord> MemoryRepository::ListSessions(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::SessionRecord> records;
  records.reserve(s.sessions.size());
  for (const auto& [_, record] : s.sessions) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.session_id < b.session_id;
  });
  return records;
}

Result MemoryRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
  if (!TX(t).View().sessions.contains(r.session_id)) return Result::Err(ErrorCode::NotFound, r.session_id);
  TX(t).Mutable(Table::kSessions, r.session_id).sessions[r.session_id] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Statements
// ------------------------------------------------------------------

Result MemoryRepository::InsertStatement(Transaction& t, const model::StatementRecord& r) {
  const auto& s = TX(t).View();
  if (s.statements.contains(r.statement_id)) return Result::Err(ErrorCode::AlreadyExists, r.statement_id);
  if (!s.sessions.contains(r.session_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown session " + r.session_id);
  TX(t).Mutable(Table::kStatements, r.statement_id).statements[r.statement_id] = r;
  return Result::Ok();
}

std::optional<model::StatementRecord> MemoryRepository::GetStatement(Transaction& t, const std::string& id) {
  return Find(TX(t).View().statements, id);
}

std::vector<model::StatementRecord> MemoryRepository::ListStatements(Transaction& t, const std::string& session_id) {
  std::vector<model::StatementRecord> out;
  for (const auto& [_, record] : TX(t).View().statements)
    if (record.session_id == session_id) out.push_back(record);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.sequence < b.sequence; });
  return out;
}

Result MemoryRepository::UpdateStatement(Transaction& t, const model::StatementRecord& r) {
  if (!TX(t).View().statements.contains(r.statement_id)) return Result::Err(ErrorCode::NotFound, r.statement_id);
  TX(t).Mutable(Table::kStatements, r.statement_id).statements[r.statement_id] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Job metadata
// ------------------------------------------------------------------

Result MemoryRepository::InsertJobMetadata(Transaction& t, const model::JobMetadataRecord& r) {
  if (TX(t).View().job_metadata.contains(r.query_id)) return Result::Err(ErrorCode::AlreadyExists, r.query_id);
  TX(t).Mutable(Table::kJobMetadata, r.query_id).job_metadata[r.query_id] = r;
  return Result::Ok();
}

std::optional<model::JobMetadataRecord> MemoryRepository::GetJobMetadata(Transaction& t, const std::string& query_id) {
  return Find(TX(t).View().job_metadata, query_id);
}

// ------------------------------------------------------------------
// Results
// ------------------------------------------------------------------

Result MemoryRepository::UpsertQueryResult(Transaction& t, const model::QueryResultRecord& r) {
  const auto key = ResultKey(r);
  TX(t).Mutable(Table::kResults, key).results[key] = r;
  return Result::Ok();
}

std::optional<model::QueryResultRecord> MemoryRepository::GetResultByJobId(Transaction& t, const std::string& job_id,
                                                                           const std::string& result_index) {
  std::optional<model::QueryResultRecord> latest;
  for (const auto& [_, record] : TX(t).View().results) {
    if (record.job_id != job_id || record.result_index != result_index) continue;
    if (!latest || record.written_at_ms >= latest->written_at_ms) latest = record;
  }
  return latest;
}

std::optional<model::QueryResultRecord> MemoryRepository::GetResultByQueryId(Transaction& t, const std::string& query_id,
                                                                             const std::string& result_index) {
  std::optional<model::QueryResultRecord> latest;
  for (const auto& [_, record] : TX(t).View().results) {
    if (record.query_id != query_id || record.result_index != result_index) continue;
    if (!latest || record.written_at_ms >= latest->written_at_ms) latest = record;
  }
  return latest;
}

// ------------------------------------------------------------------
// Index metadata
// ------------------------------------------------------------------

Result MemoryRepository::UpsertIndexMetadata(Transaction& t, const model::IndexMetadataRecord& r) {
  TX(t).Mutable(Table::kIndexMetadata, r.index_name).index_metadata[r.index_name] = r;
  return Result::Ok();
}

std::optional<model::IndexMetadataRecord> MemoryRepository::GetIndexMetadata(Transaction& t, const std::string& index_name) {
  return Find(TX(t).View().index_metadata, index_name);
}

Result MemoryRepository::DeleteIndexMetadata(Transaction& t, const std::string& index_name) {
  if (!TX(t).View().index_metadata.contains(index_name)) return Result::Err(ErrorCode::NotFound, index_name);
  TX(t).Mutable(Table::kIndexMetadata, index_name).index_metadata.erase(index_name);
  return Result::Ok();
}

} // namespace asyncquery::db::memory
