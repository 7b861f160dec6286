#include "grpc_job_client.hpp"

#include <grpcpp/client_context.h>

#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace asyncquery::backend {

namespace {

using observability::StringField;

void ThrowIfFailed(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return;
  }
  ASYNCQUERY_LOG_ERROR("job runner call failed",
                       {StringField("action", action), StringField("code", std::to_string(static_cast<int>(status.error_code()))),
                        StringField("error", status.error_message())});
  throw util::BackendError(std::string(action) + " failed: " + status.error_message());
}

} // namespace

GrpcJobClient::GrpcJobClient(std::shared_ptr<::grpc::Channel> channel)
    : stub_(asyncquery::backend::v1::JobRunnerService::NewStub(std::move(channel))) {
}

std::string GrpcJobClient::StartJobRun(const StartJobRequest& request) {
  asyncquery::backend::v1::StartJobRunRequest rpc_request;
  rpc_request.set_application_id(request.application_id);
  rpc_request.set_execution_role_arn(request.execution_role_arn);
  rpc_request.set_job_name(request.job_name);
  rpc_request.set_query(request.query);
  rpc_request.set_submit_parameters(request.submit_parameters);
  rpc_request.mutable_tags()->insert(request.tags.begin(), request.tags.end());
  rpc_request.set_structured_streaming(request.structured_streaming);
  rpc_request.set_result_index(request.result_index);

  ::grpc::ClientContext                          context;
  asyncquery::backend::v1::StartJobRunResponse response;
  ThrowIfFailed(stub_->StartJobRun(&context, rpc_request, &response), "StartJobRun");

  ASYNCQUERY_LOG_INFO("job run started", {StringField("job_name", request.job_name), StringField("job_id", response.job_id())});
  return response.job_id();
}

std::string GrpcJobClient::CancelJobRun(const std::string& application_id, const std::string& job_id) {
  asyncquery::backend::v1::CancelJobRunRequest rpc_request;
  rpc_request.set_application_id(application_id);
  rpc_request.set_job_id(job_id);

  ::grpc::ClientContext                           context;
  asyncquery::backend::v1::CancelJobRunResponse response;
  ThrowIfFailed(stub_->CancelJobRun(&context, rpc_request, &response), "CancelJobRun");
  return response.job_run_id();
}

JobRun GrpcJobClient::GetJobRun(const std::string& application_id, const std::string& job_id) {
  asyncquery::backend::v1::GetJobRunRequest rpc_request;
  rpc_request.set_application_id(application_id);
  rpc_request.set_job_id(job_id);

  ::grpc::ClientContext                        context;
  asyncquery::backend::v1::GetJobRunResponse response;
  ThrowIfFailed(stub_->GetJobRun(&context, rpc_request, &response), "GetJobRun");

  return JobRun{
      .application_id = response.job_run().application_id(),
      .job_id         = response.job_run().job_id(),
      .state          = response.job_run().state(),
  };
}

} // namespace asyncquery::backend
