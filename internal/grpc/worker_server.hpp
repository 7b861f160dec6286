#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "asyncquery/v1.hpp"
#include "internal/service/worker_service.hpp"

namespace asyncquery::grpc {

class WorkerServer final : public asyncquery::v1::WorkerService::Service {
public:
  explicit WorkerServer(std::shared_ptr<asyncquery::service::WorkerService> svc);

  ::grpc::Status FetchStatement(::grpc::ServerContext*,
                                const asyncquery::v1::FetchStatementRequest*,
                                asyncquery::v1::FetchStatementResponse*) override;

  ::grpc::Status UpdateStatement(::grpc::ServerContext*,
                                 const asyncquery::v1::UpdateStatementRequest*,
                                 asyncquery::v1::UpdateStatementResponse*) override;

  ::grpc::Status Heartbeat(::grpc::ServerContext*,
                           const asyncquery::v1::HeartbeatRequest*,
                           asyncquery::v1::HeartbeatResponse*) override;

  ::grpc::Status WriteResult(::grpc::ServerContext*,
                             const asyncquery::v1::WriteResultRequest*,
                             asyncquery::v1::WriteResultResponse*) override;

  ::grpc::Status RegisterIndex(::grpc::ServerContext*,
                               const asyncquery::v1::RegisterIndexRequest*,
                               asyncquery::v1::RegisterIndexResponse*) override;

private:
  std::shared_ptr<asyncquery::service::WorkerService> service_;
};

}
