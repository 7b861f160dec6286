#pragma once

#include <memory>
#include <optional>

#include "internal/db/api/repository.hpp"
#include "internal/response/result_reader.hpp"

namespace asyncquery::response {

class RepositoryResultReader final : public ResultReader {
 public:
  explicit RepositoryResultReader(std::shared_ptr<db::Repository> repository);

  google::protobuf::Struct ReadByJobId(const std::string& job_id, const std::string& result_index) override;
  google::protobuf::Struct ReadByQueryId(const std::string& query_id, const std::string& result_index) override;

 private:
  static google::protobuf::Struct Wrap(const std::optional<db::model::QueryResultRecord>& record);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace asyncquery::response
