#include "index_catalog.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace asyncquery::index {

using observability::BoolField;
using observability::StringField;

IndexCatalog::IndexCatalog(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void IndexCatalog::Register(const db::model::IndexMetadataRecord& record) {
  if (record.index_name.empty()) {
    throw util::InvalidArgument("index name is required");
  }

  auto stamped          = record;
  stamped.updated_at_ms = util::NowMillis();
  db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    db::ThrowIfDbError(repository_->UpsertIndexMetadata(tx, stamped), "register index");
  });

  ASYNCQUERY_LOG_INFO("index registered", {StringField("index", record.index_name), StringField("job_id", record.job_id),
                                           BoolField("auto_refresh", record.auto_refresh)});
}

IndexMetadata IndexCatalog::GetIndexMetadata(const model::IndexOperation& operation) {
  const auto index_name = operation.FlintIndexName();

  auto tx     = repository_->Begin();
  auto record = repository_->GetIndexMetadata(*tx, index_name);
  tx->Commit();

  if (!record.has_value()) {
    throw util::NotFound("index metadata not found: " + index_name);
  }
  return IndexMetadata{
      .job_id         = record->job_id,
      .application_id = record->application_id,
      .auto_refresh   = record->auto_refresh,
  };
}

bool IndexCatalog::DeleteIndex(const std::string& index_name) {
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    const auto result = repository_->DeleteIndexMetadata(tx, index_name);
    if (result.code == db::ErrorCode::NotFound) {
      return false;
    }
    db::ThrowIfDbError(result, "delete index " + index_name);
    return true;
  });
}

} // namespace asyncquery::index
