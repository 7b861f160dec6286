#pragma once

#include <memory>
#include <string>
#include <variant>

#include <google/protobuf/struct.pb.h>

#include "asyncquery/v1/dispatch.pb.h"
#include "config/config.pb.h"
#include "internal/backend/job_client.hpp"
#include "internal/datasource/data_source_service.hpp"
#include "internal/index/index_metadata_reader.hpp"
#include "internal/model/index_operation.hpp"
#include "internal/response/result_reader.hpp"
#include "internal/session/session_manager.hpp"
#include "internal/sql/query_classifier.hpp"

namespace asyncquery::dispatcher {

inline constexpr const char* kClusterTag    = "cluster";
inline constexpr const char* kDataSourceTag = "datasource";
inline constexpr const char* kIndexTag      = "index";
inline constexpr const char* kTableTag      = "table";
inline constexpr const char* kSchemaTag     = "schema";

inline constexpr const char* kIndexJobSuffix    = ":index-query";
inline constexpr const char* kNonIndexJobSuffix = ":non-index-query";

/*
  Collaborators of the dispatcher. All are required; sessions_enabled picks
  between per-query batch jobs and session statements for non-index queries.
*/
struct DispatcherContext {
  std::shared_ptr<backend::JobClient>               jobs;
  std::shared_ptr<datasource::DataSourceService>    data_sources;
  std::shared_ptr<datasource::DataSourceAuthorizer> authorizer;
  std::shared_ptr<response::ResultReader>           results;
  std::shared_ptr<index::IndexMetadataReader>       index_metadata;
  std::shared_ptr<index::IndexStore>                index_store;
  std::shared_ptr<sql::QueryClassifier>             classifier;
  std::shared_ptr<session::SessionManager>          sessions;

  runtime::config::SubmitConfig submit;
  bool                          sessions_enabled = false;
};

// ---------------------------------------------------------------------
// Routes, decided once per dispatch
// ---------------------------------------------------------------------

struct DropIndexRoute {
  model::IndexOperation operation;
};

struct CreateIndexRoute {
  model::IndexOperation operation;
};

struct NonIndexBatchRoute {};

struct NonIndexSessionRoute {};

using Route = std::variant<DropIndexRoute, CreateIndexRoute, NonIndexBatchRoute, NonIndexSessionRoute>;

/*
  QueryDispatcher

  Classifies a query, authorizes its data source and starts the matching
  execution: a batch job, a statement in a session, an index job, or a
  synthetic drop-index job. Also reconciles status and cancel requests
  against the session registry, result documents and the job runner.

  Runs on the caller's thread and adds no retries or timeouts around
  collaborator calls.
*/
class QueryDispatcher {
 public:
  explicit QueryDispatcher(DispatcherContext ctx);

  asyncquery::v1::DispatchQueryResponse Dispatch(const asyncquery::v1::DispatchQueryRequest& request);

  // Status document: {status, error, [data]}.
  google::protobuf::Struct GetQueryResponse(const asyncquery::v1::AsyncQueryJobMetadata& metadata);

  // Returns the cancelled statement id or the backend job-run id.
  std::string CancelJob(const asyncquery::v1::AsyncQueryJobMetadata& metadata);

  Route Classify(const asyncquery::v1::DispatchQueryRequest& request) const;

 private:
  asyncquery::v1::DispatchQueryResponse HandleDropIndex(const asyncquery::v1::DispatchQueryRequest& request, const DropIndexRoute& route);
  asyncquery::v1::DispatchQueryResponse HandleCreateIndex(const asyncquery::v1::DispatchQueryRequest& request, const CreateIndexRoute& route);
  asyncquery::v1::DispatchQueryResponse HandleBatch(const asyncquery::v1::DispatchQueryRequest& request);
  asyncquery::v1::DispatchQueryResponse HandleSession(const asyncquery::v1::DispatchQueryRequest& request);

  datasource::DataSourceMetadata Authorize(const asyncquery::v1::DispatchQueryRequest& request) const;

  backend::SubmitParameters BaseParameters(const datasource::DataSourceMetadata& metadata,
                                           const asyncquery::v1::DispatchQueryRequest& request) const;

  // Throws util::NotFound when either is missing.
  std::shared_ptr<session::Statement> ResolveStatement(const std::string& session_id, const std::string& statement_id);

  DispatcherContext ctx_;
};

} // namespace asyncquery::dispatcher
