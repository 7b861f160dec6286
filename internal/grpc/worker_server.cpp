#include "worker_server.hpp"
#include "grpc_error.hpp"

namespace asyncquery::grpc {

WorkerServer::WorkerServer(std::shared_ptr<asyncquery::service::WorkerService> svc)
    : service_(std::move(svc)) {}

::grpc::Status WorkerServer::FetchStatement(::grpc::ServerContext*,
                                            const asyncquery::v1::FetchStatementRequest* req,
                                            asyncquery::v1::FetchStatementResponse* resp) {
  try {
    *resp = service_->FetchStatement(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::UpdateStatement(::grpc::ServerContext*,
                                             const asyncquery::v1::UpdateStatementRequest* req,
                                             asyncquery::v1::UpdateStatementResponse* resp) {
  try {
    *resp = service_->UpdateStatement(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::Heartbeat(::grpc::ServerContext*,
                                       const asyncquery::v1::HeartbeatRequest* req,
                                       asyncquery::v1::HeartbeatResponse* resp) {
  try {
    *resp = service_->Heartbeat(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::WriteResult(::grpc::ServerContext*,
                                         const asyncquery::v1::WriteResultRequest* req,
                                         asyncquery::v1::WriteResultResponse*) {
  try {
    service_->WriteResult(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::RegisterIndex(::grpc::ServerContext*,
                                           const asyncquery::v1::RegisterIndexRequest* req,
                                           asyncquery::v1::RegisterIndexResponse*) {
  try {
    service_->RegisterIndex(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
