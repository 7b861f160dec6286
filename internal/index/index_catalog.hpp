#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/index/index_metadata_reader.hpp"

namespace asyncquery::index {

/*
  Repository-backed index registry.

  The remote program registers indexes it builds; drop-index reads the
  owning job from here and deletes the entry.
*/
class IndexCatalog final : public IndexMetadataReader, public IndexStore {
 public:
  explicit IndexCatalog(std::shared_ptr<db::Repository> repository);

  void Register(const db::model::IndexMetadataRecord& record);

  IndexMetadata GetIndexMetadata(const model::IndexOperation& operation) override;

  bool DeleteIndex(const std::string& index_name) override;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace asyncquery::index
