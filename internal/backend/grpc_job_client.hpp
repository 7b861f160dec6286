#pragma once

#include <grpcpp/channel.h>

#include <memory>
#include <string>

#include "asyncquery/backend/v1/job_runner_service.grpc.pb.h"
#include "internal/backend/job_client.hpp"

namespace asyncquery::backend {

class GrpcJobClient final : public JobClient {
 public:
  explicit GrpcJobClient(std::shared_ptr<::grpc::Channel> channel);

  std::string StartJobRun(const StartJobRequest& request) override;
  std::string CancelJobRun(const std::string& application_id, const std::string& job_id) override;
  JobRun      GetJobRun(const std::string& application_id, const std::string& job_id) override;

 private:
  std::unique_ptr<asyncquery::backend::v1::JobRunnerService::Stub> stub_;
};

} // namespace asyncquery::backend
