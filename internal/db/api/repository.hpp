#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/index_metadata_record.hpp"
#include "internal/db/model/job_metadata_record.hpp"
#include "internal/db/model/query_result_record.hpp"
#include "internal/db/model/session_record.hpp"
#include "internal/db/model/statement_record.hpp"

namespace asyncquery::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Session and statement rows are never deleted

  The DB is the source of truth for:
    sessions and statements (the in-memory registry is a cache)
    caller job metadata
    result documents
    index metadata
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Sessions
  // ---------------------------------------------------------------------

  virtual Result InsertSession(Transaction&, const model::SessionRecord&) = 0;

  virtual std::optional<model::SessionRecord> GetSession(Transaction&, const std::string& session_id) = 0;

  virtual std::vector<model::SessionRecord> ListSessions(Transaction&) = 0;

  virtual Result UpdateSession(Transaction&, const model::SessionRecord&) = 0;

  // ---------------------------------------------------------------------
  // Statements
  // ---------------------------------------------------------------------

  virtual Result InsertStatement(Transaction&, const model::StatementRecord&) = 0;

  virtual std::optional<model::StatementRecord> GetStatement(Transaction&, const std::string& statement_id) = 0;

  // Ordered by sequence.
  virtual std::vector<model::StatementRecord> ListStatements(Transaction&, const std::string& session_id) = 0;

  virtual Result UpdateStatement(Transaction&, const model::StatementRecord&) = 0;

  // ---------------------------------------------------------------------
  // Caller job metadata
  // ---------------------------------------------------------------------

  virtual Result InsertJobMetadata(Transaction&, const model::JobMetadataRecord&) = 0;

  virtual std::optional<model::JobMetadataRecord> GetJobMetadata(Transaction&, const std::string& query_id) = 0;

  // ---------------------------------------------------------------------
  // Result documents
  // ---------------------------------------------------------------------

  virtual Result UpsertQueryResult(Transaction&, const model::QueryResultRecord&) = 0;

  virtual std::optional<model::QueryResultRecord> GetResultByJobId(Transaction&, const std::string& job_id,
                                                                   const std::string& result_index) = 0;

  virtual std::optional<model::QueryResultRecord> GetResultByQueryId(Transaction&, const std::string& query_id,
                                                                     const std::string& result_index) = 0;

  // ---------------------------------------------------------------------
  // Index metadata
  // ---------------------------------------------------------------------

  virtual Result UpsertIndexMetadata(Transaction&, const model::IndexMetadataRecord&) = 0;

  virtual std::optional<model::IndexMetadataRecord> GetIndexMetadata(Transaction&, const std::string& index_name) = 0;

  // NotFound when no row matched.
  virtual Result DeleteIndexMetadata(Transaction&, const std::string& index_name) = 0;
};

/*
  Runs fn(tx) in a fresh transaction and commits, retrying the whole unit of
  work when the commit loses an optimistic race. fn must be safe to re-run.
*/
template <typename Fn>
auto RunInTransaction(Repository& repository, Fn&& fn, int max_attempts = 8) {
  for (int attempt = 1;; ++attempt) {
    auto tx = repository.Begin();
    try {
      if constexpr (std::is_void_v<std::invoke_result_t<Fn&, Transaction&>>) {
        fn(*tx);
        tx->Commit();
        return;
      } else {
        auto value = fn(*tx);
        tx->Commit();
        return value;
      }
    } catch (const TransactionConflict&) {
      if (attempt >= max_attempts) {
        throw;
      }
    }
  }
}

} // namespace asyncquery::db
