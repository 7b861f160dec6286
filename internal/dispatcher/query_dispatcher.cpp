#include "query_dispatcher.hpp"

#include <exception>
#include <map>
#include <vector>

#include "internal/dispatcher/drop_index_result.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace asyncquery::dispatcher {

using asyncquery::v1::AsyncQueryJobMetadata;
using asyncquery::v1::DispatchQueryRequest;
using asyncquery::v1::DispatchQueryResponse;
using observability::BoolField;
using observability::StringField;

namespace {

// Reported when a result document carries no status of its own.
constexpr const char* kMissingStatus = "FAILED";

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::map<std::string, std::string> DefaultTags(const DispatchQueryRequest& request) {
  return {
      {kClusterTag, request.cluster_name()},
      {kDataSourceTag, request.datasource()},
  };
}

DispatchQueryResponse MakeResponse(std::string job_id, bool synthetic, const std::string& result_index, const std::string& session_id = {}) {
  DispatchQueryResponse response;
  response.set_job_id(std::move(job_id));
  response.set_is_synthetic_op(synthetic);
  response.set_result_index(result_index);
  response.set_session_id(session_id);
  return response;
}

void SetStatus(google::protobuf::Struct& document, const std::string& status, const std::string& error) {
  auto& fields = *document.mutable_fields();
  fields[response::kStatusField].set_string_value(status);
  fields[response::kErrorField].set_string_value(error);
}

std::string StringOr(const google::protobuf::Struct& items, const char* key, const std::string& fallback) {
  const auto it = items.fields().find(key);
  if (it == items.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return fallback;
  }
  return it->second.string_value();
}

} // namespace

QueryDispatcher::QueryDispatcher(DispatcherContext ctx) : ctx_(std::move(ctx)) {
}

// ------------------------------------------------------------------
// Dispatch
// ------------------------------------------------------------------

Route QueryDispatcher::Classify(const DispatchQueryRequest& request) const {
  const Route non_index = ctx_.sessions_enabled ? Route{NonIndexSessionRoute{}} : Route{NonIndexBatchRoute{}};

  // Only SQL gets index-aware handling.
  if (request.lang_type() != asyncquery::v1::LANG_TYPE_SQL) {
    return non_index;
  }
  if (!ctx_.classifier->IsIndexQuery(request.query())) {
    return non_index;
  }

  auto operation = ctx_.classifier->ExtractIndexOperation(request.query());
  if (operation.table.datasource.empty()) {
    operation.table.datasource = request.datasource();
  }
  if (operation.IsDrop()) {
    return DropIndexRoute{std::move(operation)};
  }
  return CreateIndexRoute{std::move(operation)};
}

DispatchQueryResponse QueryDispatcher::Dispatch(const DispatchQueryRequest& request) {
  observability::SpanScope span("QueryDispatcher.Dispatch");
  span.SetAttribute("datasource", request.datasource());

  const auto route = Classify(request);
  return std::visit(Overloaded{
                        [&](const DropIndexRoute& r) {
                          span.SetAttribute("route", "drop_index");
                          return HandleDropIndex(request, r);
                        },
                        [&](const CreateIndexRoute& r) {
                          span.SetAttribute("route", "create_index");
                          return HandleCreateIndex(request, r);
                        },
                        [&](const NonIndexBatchRoute&) {
                          span.SetAttribute("route", "batch");
                          return HandleBatch(request);
                        },
                        [&](const NonIndexSessionRoute&) {
                          span.SetAttribute("route", "session");
                          return HandleSession(request);
                        },
                    },
                    route);
}

datasource::DataSourceMetadata QueryDispatcher::Authorize(const DispatchQueryRequest& request) const {
  auto metadata = ctx_.data_sources->GetRawDataSourceMetadata(request.datasource());
  const std::vector<std::string> roles(request.requester_roles().begin(), request.requester_roles().end());
  ctx_.authorizer->Authorize(metadata, roles);
  return metadata;
}

backend::SubmitParameters QueryDispatcher::BaseParameters(const datasource::DataSourceMetadata& metadata,
                                                          const DispatchQueryRequest&           request) const {
  backend::SubmitParameters parameters(ctx_.submit);
  parameters.WithDataSource(metadata).WithExtraParameters(request.extra_submit_params());
  return parameters;
}

DispatchQueryResponse QueryDispatcher::HandleCreateIndex(const DispatchQueryRequest& request, const CreateIndexRoute& route) {
  const auto  metadata  = Authorize(request);
  const auto& operation = route.operation;

  auto tags        = DefaultTags(request);
  tags[kIndexTag]  = operation.FlintIndexName();
  tags[kTableTag]  = operation.table.table;
  tags[kSchemaTag] = operation.table.schema;

  auto parameters = BaseParameters(metadata, request);
  parameters.WithStructuredStreaming(operation.auto_refresh);

  backend::StartJobRequest start;
  start.query                = request.query();
  start.job_name             = request.cluster_name() + kIndexJobSuffix;
  start.application_id       = request.application_id();
  start.execution_role_arn   = request.execution_role_arn();
  start.submit_parameters    = parameters.ToString();
  start.tags                 = std::move(tags);
  start.structured_streaming = operation.auto_refresh;
  start.result_index         = metadata.result_index;

  const auto job_id = ctx_.jobs->StartJobRun(start);
  observability::Metrics::Instance().RecordDispatch("create_index");
  ASYNCQUERY_LOG_INFO("index query dispatched", {StringField("job_id", job_id), StringField("index", operation.FlintIndexName()),
                                                 BoolField("auto_refresh", operation.auto_refresh)});
  return MakeResponse(job_id, false, metadata.result_index);
}

DispatchQueryResponse QueryDispatcher::HandleBatch(const DispatchQueryRequest& request) {
  const auto metadata = Authorize(request);

  backend::StartJobRequest start;
  start.query              = request.query();
  start.job_name           = request.cluster_name() + kNonIndexJobSuffix;
  start.application_id     = request.application_id();
  start.execution_role_arn = request.execution_role_arn();
  start.submit_parameters  = BaseParameters(metadata, request).ToString();
  start.tags               = DefaultTags(request);
  start.result_index       = metadata.result_index;

  const auto job_id = ctx_.jobs->StartJobRun(start);
  observability::Metrics::Instance().RecordDispatch("batch");
  ASYNCQUERY_LOG_INFO("batch query dispatched", {StringField("job_id", job_id), StringField("datasource", metadata.name)});
  return MakeResponse(job_id, false, metadata.result_index);
}

DispatchQueryResponse QueryDispatcher::HandleSession(const DispatchQueryRequest& request) {
  const auto metadata = Authorize(request);

  std::shared_ptr<session::Session> session;
  if (!request.session_id().empty()) {
    session = ctx_.sessions->GetSession(request.session_id());
    if (!session) {
      throw util::NotFound("no session found. " + request.session_id());
    }
  } else {
    auto parameters = BaseParameters(metadata, request);
    parameters.WithClassName(ctx_.submit.session_class_name().empty() ? backend::kSessionClassName : ctx_.submit.session_class_name());

    session = ctx_.sessions->CreateSession(session::CreateSessionRequest{
        .job_name           = request.cluster_name() + kNonIndexJobSuffix,
        .application_id     = request.application_id(),
        .execution_role_arn = request.execution_role_arn(),
        .parameters         = std::move(parameters),
        .tags               = DefaultTags(request),
        .result_index       = metadata.result_index,
        .datasource_name    = metadata.name,
    });
  }

  const auto statement_id = session->Submit(session::QueryRequest{
      .lang_type    = request.lang_type(),
      .query        = request.query(),
      .result_index = metadata.result_index,
  });

  observability::Metrics::Instance().RecordDispatch("session");
  return MakeResponse(statement_id, false, metadata.result_index, session->Id());
}

/*
  Cancel and delete are independent best-effort steps, each attempted at
  most once. Neither failure escapes; only the delete outcome decides the
  synthetic status, and an unacknowledged delete counts as a failure.
*/
DispatchQueryResponse QueryDispatcher::HandleDropIndex(const DispatchQueryRequest& request, const DropIndexRoute& route) {
  const auto  metadata   = Authorize(request);
  const auto& operation  = route.operation;
  const auto  index_name = operation.FlintIndexName();
  const auto  index      = ctx_.index_metadata->GetIndexMetadata(operation);

  // Step 1: stop the refresh job, if there is one.
  if (index.auto_refresh) {
    try {
      ctx_.jobs->CancelJobRun(request.application_id(), index.job_id);
    } catch (const std::exception& e) {
      ASYNCQUERY_LOG_WARN("refresh job cancel failed; deleting index anyway",
                          {StringField("index", index_name), StringField("job_id", index.job_id), StringField("error", e.what())});
    }
  }

  // Step 2: delete the index, regardless of step 1.
  bool deleted = false;
  try {
    deleted = ctx_.index_store->DeleteIndex(index_name);
    if (!deleted) {
      ASYNCQUERY_LOG_ERROR("failed to delete index", {StringField("index", index_name), StringField("error", "not acknowledged")});
    }
  } catch (const std::exception& e) {
    ASYNCQUERY_LOG_ERROR("failed to delete index", {StringField("index", index_name), StringField("error", e.what())});
  }

  const DropIndexResult result(deleted ? DropIndexResult::kSuccess : DropIndexResult::kFailed);
  observability::Metrics::Instance().RecordDispatch("drop_index");
  observability::Metrics::Instance().RecordDropIndexOutcome(result.Status());
  ASYNCQUERY_LOG_INFO("drop index dispatched", {StringField("index", index_name), StringField("status", result.Status())});
  return MakeResponse(result.ToJobId(), true, metadata.result_index);
}

// ------------------------------------------------------------------
// Status and cancel
// ------------------------------------------------------------------

std::shared_ptr<session::Statement> QueryDispatcher::ResolveStatement(const std::string& session_id, const std::string& statement_id) {
  auto session = ctx_.sessions->GetSession(session_id);
  if (!session) {
    throw util::NotFound("no session found. " + session_id);
  }
  auto statement = session->Get(statement_id);
  if (!statement) {
    throw util::NotFound("no statement found. " + statement_id);
  }
  return statement;
}

google::protobuf::Struct QueryDispatcher::GetQueryResponse(const AsyncQueryJobMetadata& metadata) {
  if (metadata.is_drop_index_op()) {
    return DropIndexResult::FromJobId(metadata.job_id()).Result();
  }

  const bool session_scoped = !metadata.session_id().empty();

  // For session-scoped metadata job_id carries the statement id.
  auto result = session_scoped ? ctx_.results->ReadByQueryId(metadata.job_id(), metadata.result_index())
                               : ctx_.results->ReadByJobId(metadata.job_id(), metadata.result_index());

  // A result document, once written, is authoritative over job state.
  const auto data = result.fields().find(response::kDataField);
  if (data != result.fields().end()) {
    const google::protobuf::Struct empty;
    const auto& items = data->second.kind_case() == google::protobuf::Value::kStructValue ? data->second.struct_value() : empty;
    SetStatus(result, StringOr(items, response::kStatusField, kMissingStatus), StringOr(items, response::kErrorField, ""));
    return result;
  }

  if (session_scoped) {
    const auto statement = ResolveStatement(metadata.session_id(), metadata.job_id());
    SetStatus(result, model::ToString(statement->State()), statement->Error());
    return result;
  }

  const auto run = ctx_.jobs->GetJobRun(metadata.application_id(), metadata.job_id());
  SetStatus(result, run.state, "");
  return result;
}

std::string QueryDispatcher::CancelJob(const AsyncQueryJobMetadata& metadata) {
  if (metadata.is_drop_index_op()) {
    // Already terminal; there is no job behind a synthetic id.
    return metadata.job_id();
  }

  if (!metadata.session_id().empty()) {
    const auto statement = ResolveStatement(metadata.session_id(), metadata.job_id());
    if (!statement->Cancel()) {
      ASYNCQUERY_LOG_INFO("cancel ignored for finished statement",
                          {StringField("statement_id", statement->Id()), StringField("state", model::ToString(statement->State()))});
    }
    return statement->Id();
  }

  return ctx_.jobs->CancelJobRun(metadata.application_id(), metadata.job_id());
}

} // namespace asyncquery::dispatcher
