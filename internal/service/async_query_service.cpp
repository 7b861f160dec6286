#include "async_query_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/dispatcher/query_dispatcher.hpp"
#include "internal/response/result_reader.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace asyncquery::service {

using namespace asyncquery::v1;

namespace {

void Validate(const CreateAsyncQueryRequest& req) {
  if (req.query().empty()) {
    throw util::InvalidArgument("Query can't be null or empty.");
  }
  if (req.datasource().empty()) {
    throw util::InvalidArgument("Datasource can't be null or empty.");
  }
  if (req.lang_type() != LANG_TYPE_SQL && req.lang_type() != LANG_TYPE_PPL) {
    throw util::InvalidArgument("Unsupported lang type; expected SQL or PPL.");
  }
}

AsyncQueryJobMetadata FromRecord(const db::model::JobMetadataRecord& record) {
  AsyncQueryJobMetadata metadata;
  metadata.set_query_id(record.query_id);
  metadata.set_application_id(record.application_id);
  metadata.set_job_id(record.job_id);
  metadata.set_is_drop_index_op(record.is_drop_index_op);
  metadata.set_result_index(record.result_index);
  metadata.set_session_id(record.session_id);
  metadata.set_datasource(record.datasource);
  return metadata;
}

std::string DocumentString(const google::protobuf::Struct& document, const char* key) {
  const auto it = document.fields().find(key);
  return it == document.fields().end() ? std::string() : it->second.string_value();
}

} // namespace

AsyncQueryService::AsyncQueryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateAsyncQueryResponse AsyncQueryService::CreateAsyncQuery(const CreateAsyncQueryRequest& req) {
  return ObserveRpc("AsyncQueryService.CreateAsyncQuery", "datasource", req.datasource(), [&] {
    Validate(req);

    const auto&          engine = ctx_.execution_engine;
    DispatchQueryRequest dispatch;
    dispatch.set_application_id(engine.application_id());
    dispatch.set_query(req.query());
    dispatch.set_datasource(req.datasource());
    dispatch.set_lang_type(req.lang_type());
    dispatch.set_execution_role_arn(engine.execution_role_arn());
    dispatch.set_cluster_name(engine.cluster_name());
    dispatch.set_extra_submit_params(engine.extra_submit_params());
    dispatch.set_session_id(req.session_id());
    *dispatch.mutable_requester_roles() = req.requester_roles();

    const auto dispatched = ctx_.dispatcher->Dispatch(dispatch);

    db::model::JobMetadataRecord record;
    record.query_id         = dispatched.job_id();
    record.application_id   = engine.application_id();
    record.job_id           = dispatched.job_id();
    record.is_drop_index_op = dispatched.is_synthetic_op();
    record.result_index     = dispatched.result_index();
    record.session_id       = dispatched.session_id();
    record.datasource       = req.datasource();
    record.created_at_ms    = util::NowMillis();

    db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      db::ThrowIfDbError(ctx_.repository->InsertJobMetadata(tx, record), "store job metadata");
    });

    CreateAsyncQueryResponse resp;
    resp.set_query_id(record.query_id);
    resp.set_session_id(record.session_id);
    return resp;
  });
}

GetAsyncQueryResultsResponse AsyncQueryService::GetAsyncQueryResults(const GetAsyncQueryResultsRequest& req) {
  return ObserveRpc("AsyncQueryService.GetAsyncQueryResults", "query_id", req.query_id(), [&] {
    const auto metadata = LoadMetadata(req.query_id());
    auto       document = ctx_.dispatcher->GetQueryResponse(metadata);

    GetAsyncQueryResultsResponse resp;
    resp.set_status(DocumentString(document, response::kStatusField));
    resp.set_error(DocumentString(document, response::kErrorField));
    *resp.mutable_document() = std::move(document);
    return resp;
  });
}

CancelAsyncQueryResponse AsyncQueryService::CancelAsyncQuery(const CancelAsyncQueryRequest& req) {
  return ObserveRpc("AsyncQueryService.CancelAsyncQuery", "query_id", req.query_id(), [&] {
    const auto metadata = LoadMetadata(req.query_id());

    CancelAsyncQueryResponse resp;
    resp.set_cancelled_id(ctx_.dispatcher->CancelJob(metadata));
    return resp;
  });
}

AsyncQueryJobMetadata AsyncQueryService::LoadMetadata(const std::string& query_id) {
  if (query_id.empty()) {
    throw util::InvalidArgument("query_id is required");
  }

  auto tx     = ctx_.repository->Begin();
  auto record = ctx_.repository->GetJobMetadata(*tx, query_id);
  tx->Commit();

  if (!record.has_value()) {
    throw util::NotFound("QueryId: " + query_id + " not found");
  }
  return FromRecord(*record);
}

}
