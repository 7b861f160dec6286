#include "worker_service.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/db/api/repository.hpp"
#include "internal/index/index_catalog.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/session/session_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace asyncquery::service {

using namespace asyncquery::v1;
using observability::StringField;

WorkerService::WorkerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::shared_ptr<session::Session> WorkerService::RequireSession(const std::string& session_id) {
  if (session_id.empty()) {
    throw util::InvalidArgument("session_id is required");
  }
  auto session = ctx_.sessions->GetSession(session_id);
  if (!session) {
    throw util::NotFound("no session found. " + session_id);
  }
  return session;
}

FetchStatementResponse WorkerService::FetchStatement(const FetchStatementRequest& req) {
  return ObserveRpc("WorkerService.FetchStatement", "session_id", req.session_id(), [&] {
    auto session = RequireSession(req.session_id());

    // First contact from the program means the session is up.
    if (session->State() == SESSION_STATE_NOT_STARTED) {
      session->TransitionTo(SESSION_STATE_RUNNING);
    }
    session->Heartbeat();

    FetchStatementResponse resp;
    if (model::IsTerminal(session->State())) {
      return resp;
    }

    auto statement = session->ClaimNextWaiting();
    if (!statement) {
      return resp;
    }

    resp.set_found(true);
    auto* info = resp.mutable_statement();
    info->set_statement_id(statement->Id());
    info->set_session_id(statement->SessionId());
    info->set_lang_type(statement->Lang());
    info->set_query(statement->Query());
    info->set_state(statement->State());
    info->set_result_index(statement->ResultIndex());

    ASYNCQUERY_LOG_INFO("statement claimed", {StringField("session_id", session->Id()), StringField("statement_id", statement->Id())});
    return resp;
  });
}

UpdateStatementResponse WorkerService::UpdateStatement(const UpdateStatementRequest& req) {
  return ObserveRpc("WorkerService.UpdateStatement", "statement_id", req.statement_id(), [&] {
    if (req.state() == STATEMENT_STATE_UNSPECIFIED || req.state() == STATEMENT_STATE_WAITING) {
      throw util::InvalidArgument("statement state must be running, success, error or cancelled");
    }

    auto session   = RequireSession(req.session_id());
    auto statement = session->Get(req.statement_id());
    if (!statement) {
      throw util::NotFound("no statement found. " + req.statement_id());
    }

    UpdateStatementResponse resp;
    resp.set_applied(statement->Transition(req.state(), req.error()));
    resp.set_state(statement->State());
    if (!resp.applied()) {
      ASYNCQUERY_LOG_INFO("statement update ignored", {StringField("statement_id", statement->Id()),
                                                       StringField("requested", model::ToString(req.state())),
                                                       StringField("state", model::ToString(statement->State()))});
    }
    return resp;
  });
}

HeartbeatResponse WorkerService::Heartbeat(const HeartbeatRequest& req) {
  return ObserveRpc("WorkerService.Heartbeat", "session_id", req.session_id(), [&] {
    auto session = RequireSession(req.session_id());
    session->Heartbeat();

    if (req.state() != SESSION_STATE_UNSPECIFIED && req.state() != session->State()) {
      if (!session->TransitionTo(req.state())) {
        throw util::InvalidState("session " + session->Id() + ": cannot move from " + model::ToString(session->State()) + " to " +
                                 model::ToString(req.state()));
      }
    }

    HeartbeatResponse resp;
    resp.set_state(session->State());
    return resp;
  });
}

void WorkerService::WriteResult(const WriteResultRequest& req) {
  ObserveRpc("WorkerService.WriteResult", "job_id", req.job_id(), [&] {
    if (req.result_index().empty()) {
      throw util::InvalidArgument("result_index is required");
    }
    if (req.job_id().empty() && req.query_id().empty()) {
      throw util::InvalidArgument("job_id or query_id is required");
    }

    db::model::QueryResultRecord record;
    record.job_id        = req.job_id();
    record.query_id      = req.query_id();
    record.result_index  = req.result_index();
    record.written_at_ms = util::NowMillis();
    if (!google::protobuf::util::MessageToJsonString(req.document(), &record.document_json).ok()) {
      throw util::InvalidArgument("result document is not representable as JSON");
    }

    db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      db::ThrowIfDbError(ctx_.repository->UpsertQueryResult(tx, record), "write result");
    });
  });
}

void WorkerService::RegisterIndex(const RegisterIndexRequest& req) {
  ObserveRpc("WorkerService.RegisterIndex", "index", req.index_name(), [&] {
    db::model::IndexMetadataRecord record;
    record.index_name     = req.index_name();
    record.datasource     = req.datasource();
    record.job_id         = req.job_id();
    record.application_id = req.application_id();
    record.auto_refresh   = req.auto_refresh();
    ctx_.index_catalog->Register(record);
  });
}

}
