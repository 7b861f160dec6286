#pragma once

#include <cstddef>
#include <string>
#include <utility>

#include <google/protobuf/struct.pb.h>

namespace asyncquery::dispatcher {

/*
  Synthetic job id for a drop-index dispatch.

  No remote job backs a drop, so the outcome travels inside the id itself:
  base64(<10 random alphanumerics><status>). The prefix only keeps repeated
  encodings of the same status distinct and is discarded on decode.
*/
class DropIndexResult {
 public:
  static constexpr std::size_t kPrefixLength = 10;

  static constexpr const char* kSuccess = "SUCCESS";
  static constexpr const char* kFailed  = "FAILED";

  explicit DropIndexResult(std::string status) : status_(std::move(status)) {
  }

  // Throws util::InvalidArgument on ids that are not valid base64 or are
  // shorter than the prefix.
  static DropIndexResult FromJobId(const std::string& job_id);

  std::string ToJobId() const;

  const std::string& Status() const {
    return status_;
  }

  // Case-insensitive match against kSuccess.
  bool Succeeded() const;

  // Status document served for the synthetic job.
  google::protobuf::Struct Result() const;

 private:
  std::string status_;
};

} // namespace asyncquery::dispatcher
