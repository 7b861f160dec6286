#pragma once

#include <optional>
#include <string_view>

#include "internal/model/index_operation.hpp"

namespace asyncquery::sql {

/*
  Decides whether query text is an index-lifecycle statement and extracts
  the index it targets.
*/
class QueryClassifier {
 public:
  virtual ~QueryClassifier() = default;

  virtual bool IsIndexQuery(std::string_view query) const = 0;

  // Throws util::InvalidArgument when the text is not an index query.
  virtual model::IndexOperation ExtractIndexOperation(std::string_view query) const = 0;
};

/*
  Recognizes the Flint index DDL subset:

    CREATE|REFRESH|DROP SKIPPING INDEX [IF [NOT] EXISTS] ON <table> ...
    CREATE|REFRESH|DROP INDEX [IF [NOT] EXISTS] <name> ON <table> ...
    CREATE|REFRESH|DROP MATERIALIZED VIEW [IF [NOT] EXISTS] <name> ...
    ... WITH (auto_refresh = true, ...)

  Keywords are case-insensitive. Everything else is a non-index query.
*/
class FlintQueryClassifier final : public QueryClassifier {
 public:
  bool IsIndexQuery(std::string_view query) const override;

  model::IndexOperation ExtractIndexOperation(std::string_view query) const override;

 private:
  static std::optional<model::IndexOperation> Parse(std::string_view query);
};

} // namespace asyncquery::sql
