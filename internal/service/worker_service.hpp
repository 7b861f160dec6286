#pragma once

#include <memory>
#include <string>

#include "asyncquery/v1/worker_service.pb.h"
#include "service_context.hpp"

namespace asyncquery::session { class Session; }

namespace asyncquery::service {

/*
  Endpoint for the session-serving program running inside the remote job:
  claims statements, reports their outcome, heartbeats, writes result
  documents and registers the indexes it builds.
*/
class WorkerService {
public:
  explicit WorkerService(ServiceContext ctx);

  asyncquery::v1::FetchStatementResponse
  FetchStatement(const asyncquery::v1::FetchStatementRequest& req);

  asyncquery::v1::UpdateStatementResponse
  UpdateStatement(const asyncquery::v1::UpdateStatementRequest& req);

  asyncquery::v1::HeartbeatResponse
  Heartbeat(const asyncquery::v1::HeartbeatRequest& req);

  void WriteResult(const asyncquery::v1::WriteResultRequest& req);

  void RegisterIndex(const asyncquery::v1::RegisterIndexRequest& req);

private:
  std::shared_ptr<asyncquery::session::Session> RequireSession(const std::string& session_id);

  ServiceContext ctx_;
};

}
