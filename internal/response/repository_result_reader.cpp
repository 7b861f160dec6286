#include "repository_result_reader.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace asyncquery::response {

RepositoryResultReader::RepositoryResultReader(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

google::protobuf::Struct RepositoryResultReader::ReadByJobId(const std::string& job_id, const std::string& result_index) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetResultByJobId(*tx, job_id, result_index);
  tx->Commit();
  return Wrap(record);
}

google::protobuf::Struct RepositoryResultReader::ReadByQueryId(const std::string& query_id, const std::string& result_index) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetResultByQueryId(*tx, query_id, result_index);
  tx->Commit();
  return Wrap(record);
}

google::protobuf::Struct RepositoryResultReader::Wrap(const std::optional<db::model::QueryResultRecord>& record) {
  google::protobuf::Struct out;
  if (!record.has_value()) {
    return out;
  }

  google::protobuf::Struct document;
  if (!google::protobuf::util::JsonStringToMessage(record->document_json, &document).ok()) {
    throw std::runtime_error("corrupt result document for job " + record->job_id);
  }
  *(*out.mutable_fields())[kDataField].mutable_struct_value() = std::move(document);
  return out;
}

} // namespace asyncquery::response
