/* Copyright 2026 Google LLC

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    https://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
==============================================================================*/
#ifndef OCI_METADATA_METADATA_STORE_RDBMS_METADATA_ACCESS_OBJECT_H_
#define OCI_METADATA_METADATA_STORE_RDBMS_METADATA_ACCESS_OBJECT_H_

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "oci_metadata/metadata_store/metadata_access_object.h"
#include "oci_metadata/metadata_store/query_executor.h"
#include "oci_metadata/proto/metadata_store.pb.h"

namespace oci_metadata {

// An implementation of MetadataAccessObject for a relational database.
//
// This class contains a QueryExecutor object, that handles direct access to the
// database. The intent is that this class should not be subclassed: instead,
// a new subclass of QueryExecutor should be created.
class RdbmsMetadataAccessObject : public MetadataAccessObject {
 public:
  explicit RdbmsMetadataAccessObject(std::unique_ptr<QueryExecutor> executor)
      : executor_(std::move(executor)) {}
  ~RdbmsMetadataAccessObject() override = default;

  // default & copy constructors are disallowed.
  RdbmsMetadataAccessObject() = delete;
  RdbmsMetadataAccessObject(const RdbmsMetadataAccessObject&) = delete;
  RdbmsMetadataAccessObject& operator=(const RdbmsMetadataAccessObject&) =
      delete;

  absl::Status InitMetadataSource() final {
    return executor_->InitMetadataSource();
  }

  absl::Status InitMetadataSourceIfNotExists(
      bool enable_upgrade_migration = false) final {
    return executor_->InitMetadataSourceIfNotExists(enable_upgrade_migration);
  }

  absl::Status DeleteMetadataSource() final {
    return executor_->DeleteMetadataSource();
  }

  absl::Status DowngradeMetadataSource(int64_t to_schema_version) final {
    return executor_->DowngradeMetadataSource(to_schema_version);
  }

  absl::Status GetSchemaVersion(int64_t* db_version) final {
    return executor_->GetSchemaVersion(db_version);
  }

  absl::Status CreateImage(const Image& image, int64_t* image_id) final;

  absl::Status UpdateImage(const Image& image) final;

  absl::Status FindImagesById(absl::Span<const int64_t> image_ids,
                              std::vector<Image>* images) final;

  absl::Status FindImageByReference(absl::string_view reference,
                                    Image* image) final;

  absl::Status DeleteImagesById(absl::Span<const int64_t> image_ids) final {
    return executor_->DeleteImagesById(image_ids);
  }

  absl::Status CreateManifest(const Manifest& manifest,
                              int64_t* manifest_id) final;

  absl::Status FindManifestsById(absl::Span<const int64_t> manifest_ids,
                                 std::vector<Manifest>* manifests) final;

  absl::Status FindManifestsByImageId(int64_t image_id,
                                      std::vector<Manifest>* manifests) final;

 private:
  std::unique_ptr<QueryExecutor> executor_;
};

}  // namespace oci_metadata

#endif  // OCI_METADATA_METADATA_STORE_RDBMS_METADATA_ACCESS_OBJECT_H_
