#include "index_operation.hpp"

#include <string>
#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_replace.h>
#include <absl/strings/str_split.h>

namespace asyncquery::model {

namespace {

std::string StripBackticks(std::string_view part) {
  return absl::StrReplaceAll(absl::string_view(part.data(), part.size()), {{"`", ""}});
}

} // namespace

FullyQualifiedTableName FullyQualifiedTableName::Parse(std::string_view full_name) {
  std::vector<std::string> parts = absl::StrSplit(StripBackticks(full_name), '.');

  FullyQualifiedTableName name;
  if (parts.size() >= 3) {
    name.datasource = parts[parts.size() - 3];
  }
  if (parts.size() >= 2) {
    name.schema = parts[parts.size() - 2];
  }
  name.table = parts.back();
  return name;
}

std::string IndexOperation::FlintIndexName() const {
  std::string name;
  switch (type) {
    case IndexType::kSkipping:
      name = absl::StrCat("flint_", table.datasource, "_", table.schema, "_", table.table, "_skipping_index");
      break;
    case IndexType::kCovering:
      name = absl::StrCat("flint_", table.datasource, "_", table.schema, "_", table.table, "_", index_name, "_index");
      break;
    case IndexType::kMaterializedView:
      name = absl::StrCat("flint_", absl::StrReplaceAll(index_name, {{"`", ""}, {".", "_"}}));
      break;
  }
  return absl::AsciiStrToLower(name);
}

} // namespace asyncquery::model
