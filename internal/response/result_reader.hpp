#pragma once

#include <string>

#include <google/protobuf/struct.pb.h>

namespace asyncquery::response {

inline constexpr const char* kDataField   = "data";
inline constexpr const char* kStatusField = "status";
inline constexpr const char* kErrorField  = "error";

/*
  Reads result documents written by the remote program.

  Returns an empty Struct while nothing has been written yet, otherwise
  {"data": <document>} where the document may carry status and error.
*/
class ResultReader {
 public:
  virtual ~ResultReader() = default;

  virtual google::protobuf::Struct ReadByJobId(const std::string& job_id, const std::string& result_index) = 0;

  virtual google::protobuf::Struct ReadByQueryId(const std::string& query_id, const std::string& result_index) = 0;
};

} // namespace asyncquery::response
