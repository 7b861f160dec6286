#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace asyncquery::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSession(Transaction&, const model::SessionRecord&) override;
  std::optional<model::SessionRecord> GetSession(Transaction&, const std::string&) override;
  std::vector<model::SessionRecord> ListSessions(Transaction&) override;
  Result UpdateSession(Transaction&, const model::SessionRecord&) override;

  Result InsertStatement(Transaction&, const model::StatementRecord&) override;
  std::optional<model::StatementRecord> GetStatement(Transaction&, const std::string&) override;
  std::vector<model::StatementRecord> ListStatements(Transaction&, const std::string& session_id) override;
  Result UpdateStatement(Transaction&, const model::StatementRecord&) override;

  Result InsertJobMetadata(Transaction&, const model::JobMetadataRecord&) override;
  std::optional<model::JobMetadataRecord> GetJobMetadata(Transaction&, const std::string&) override;

  Result UpsertQueryResult(Transaction&, const model::QueryResultRecord&) override;
  std::optional<model::QueryResultRecord> GetResultByJobId(Transaction&, const std::string& job_id,
                                                           const std::string& result_index) override;
  std::optional<model::QueryResultRecord> GetResultByQueryId(Transaction&, const std::string& query_id,
                                                             const std::string& result_index) override;

  Result UpsertIndexMetadata(Transaction&, const model::IndexMetadataRecord&) override;
  std::optional<model::IndexMetadataRecord> GetIndexMetadata(Transaction&, const std::string&) override;
  Result DeleteIndexMetadata(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  enum class Table { kSessions, kStatements, kJobMetadata, kResults, kIndexMetadata };
  using RowKey = std::pair<Table, std::string>;

  struct State {
    std::unordered_map<std::string, model::SessionRecord> sessions;
    std::unordered_map<std::string, model::StatementRecord> statements;
    std::unordered_map<std::string, model::JobMetadataRecord> job_metadata;
    std::unordered_map<std::string, model::QueryResultRecord> results; // result_index#job_id
    std::unordered_map<std::string, model::IndexMetadataRecord> index_metadata;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
  // Version of the commit that last wrote each row.
  std::map<RowKey, uint64_t> row_versions_;
};

} // namespace asyncquery::db::memory
