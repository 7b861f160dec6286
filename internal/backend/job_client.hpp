#pragma once

#include <map>
#include <string>

namespace asyncquery::backend {

struct StartJobRequest {
  std::string                        query;
  std::string                        job_name;
  std::string                        application_id;
  std::string                        execution_role_arn;
  std::string                        submit_parameters;
  std::map<std::string, std::string> tags;
  bool                               structured_streaming = false;
  std::string                        result_index;
};

struct JobRun {
  std::string application_id;
  std::string job_id;
  std::string state;
};

/*
  Remote compute backend. Calls block until the backend answers; failures
  surface as util::BackendError. No retries happen at this layer.
*/
class JobClient {
 public:
  virtual ~JobClient() = default;

  // Returns the new job id.
  virtual std::string StartJobRun(const StartJobRequest& request) = 0;

  // Returns the backend's job-run id.
  virtual std::string CancelJobRun(const std::string& application_id, const std::string& job_id) = 0;

  virtual JobRun GetJobRun(const std::string& application_id, const std::string& job_id) = 0;
};

} // namespace asyncquery::backend
