#pragma once

#include <string>
#include <string_view>

namespace asyncquery::model {

enum class IndexAction {
  kCreate,
  kRefresh,
  kDrop,
};

enum class IndexType {
  kSkipping,
  kCovering,
  kMaterializedView,
};

/*
  <datasource>.<schema>.<table>; shorter forms fill from the right.
*/
struct FullyQualifiedTableName {
  std::string datasource;
  std::string schema;
  std::string table;

  static FullyQualifiedTableName Parse(std::string_view full_name);
};

/*
  Parsed description of an index-lifecycle query, produced by the classifier
  and consumed once per dispatch.
*/
struct IndexOperation {
  IndexAction action = IndexAction::kCreate;
  IndexType   type   = IndexType::kSkipping;

  // Covering index name or materialized view name; empty for skipping indexes.
  std::string             index_name;
  FullyQualifiedTableName table;
  bool                    auto_refresh = false;

  bool IsDrop() const {
    return action == IndexAction::kDrop;
  }

  // Name of the backing index in the document store, lower-cased.
  std::string FlintIndexName() const;
};

} // namespace asyncquery::model
