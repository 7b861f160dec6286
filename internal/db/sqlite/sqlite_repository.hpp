#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace asyncquery::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace asyncquery::db::sqlite
