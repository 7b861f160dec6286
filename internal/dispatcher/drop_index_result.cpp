#include "drop_index_result.hpp"

#include <absl/strings/escaping.h>
#include <absl/strings/match.h>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace asyncquery::dispatcher {

namespace {

constexpr const char* kFakeApplicationId = "fakeDropIndexApplicationId";
constexpr const char* kDropFailedMessage = "failed to drop index";

} // namespace

DropIndexResult DropIndexResult::FromJobId(const std::string& job_id) {
  std::string decoded;
  if (!absl::Base64Unescape(job_id, &decoded)) {
    throw util::InvalidArgument("malformed synthetic job id: " + job_id);
  }
  if (decoded.size() < kPrefixLength) {
    throw util::InvalidArgument("synthetic job id too short: " + job_id);
  }
  return DropIndexResult(decoded.substr(kPrefixLength));
}

bool DropIndexResult::Succeeded() const {
  return absl::EqualsIgnoreCase(status_, kSuccess);
}

std::string DropIndexResult::ToJobId() const {
  return absl::Base64Escape(util::RandomAlphanumeric(kPrefixLength) + status_);
}

google::protobuf::Struct DropIndexResult::Result() const {
  google::protobuf::Struct document;
  auto&                    fields = *document.mutable_fields();
  fields["status"].set_string_value(status_);

  if (Succeeded()) {
    auto& data = *fields["data"].mutable_struct_value()->mutable_fields();
    data["result"].mutable_list_value();
    data["schema"].mutable_list_value();
    data["applicationId"].set_string_value(kFakeApplicationId);
  } else {
    fields["error"].set_string_value(kDropFailedMessage);
  }
  return document;
}

} // namespace asyncquery::dispatcher
