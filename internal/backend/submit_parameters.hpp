#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config/config.pb.h"
#include "internal/datasource/data_source_metadata.hpp"

namespace asyncquery::backend {

inline constexpr const char* kDefaultClassName = "org.apache.spark.sql.FlintJob";
inline constexpr const char* kSessionClassName = "org.apache.spark.sql.FlintREPL";

inline constexpr const char* kJobTypeKey          = "spark.flint.job.type";
inline constexpr const char* kJobTypeStreaming    = "streaming";
inline constexpr const char* kSessionIdKey        = "spark.flint.job.sessionId";
inline constexpr const char* kRequestIndexKey     = "spark.flint.job.requestIndex";
inline constexpr const char* kRequestIndexPrefix  = ".query_execution_request_";

/*
  Builds the submission payload handed to the job runner:

    --class <class> --conf k=v --conf k=v ... <extra parameters>

  Conf entries keep insertion order; setting an existing key replaces its
  value in place.
*/
class SubmitParameters {
 public:
  explicit SubmitParameters(const runtime::config::SubmitConfig& config);

  SubmitParameters& WithClassName(std::string class_name);
  SubmitParameters& WithDataSource(const datasource::DataSourceMetadata& metadata);
  SubmitParameters& WithStructuredStreaming(bool streaming);
  SubmitParameters& WithSessionExecution(const std::string& session_id, const std::string& datasource_name);
  SubmitParameters& WithExtraParameters(std::string extra);

  void                       SetConf(const std::string& key, std::string value);
  std::optional<std::string> Conf(const std::string& key) const;

  const std::string& ClassName() const {
    return class_name_;
  }

  std::string ToString() const;

 private:
  std::string                                      class_name_;
  std::vector<std::pair<std::string, std::string>> conf_;
  std::string                                      extra_parameters_;
};

} // namespace asyncquery::backend
