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
#ifndef OCI_METADATA_METADATA_STORE_METADATA_ACCESS_OBJECT_H_
#define OCI_METADATA_METADATA_STORE_METADATA_ACCESS_OBJECT_H_

#include <cstdint>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "oci_metadata/proto/metadata_source.pb.h"
#include "oci_metadata/proto/metadata_store.pb.h"

namespace oci_metadata {

// Data access object (DAO) for the domain entities (Image, Manifest) defined
// in metadata_store.proto. It provides a list of query methods to store,
// update, and read entities, and to migrate the schema they live in. It takes
// a MetadataSourceQueryConfig which specifies query instructions on the given
// MetadataSource.
// Each method is a list of queries which needs to be run within a transaction,
// and the caller can use the methods provided and compose larger transactions
// externally. The caller is responsible to commit or rollback depending on the
// return status of each method. It is thread-unsafe.
//
// Usage example:
//
//    SomeConcreteMetadataSource src;
//    MetadataSourceQueryConfig config;
//    std::unique_ptr<MetadataAccessObject> mao;
//    CHECK_EQ(absl::OkStatus(), CreateMetadataAccessObject(config, &src,
//    &mao));
//
//    if (mao->SomeCRUDMethod(...).ok())
//      CHECK_EQ(absl::OkStatus(), src.Commit()); // or do more queries
//    else
//      CHECK_EQ(absl::OkStatus(), src.Rollback());
//
class MetadataAccessObject {
 public:
  virtual ~MetadataAccessObject() = default;

  // default & copy constructors are disallowed.
  MetadataAccessObject() = default;
  MetadataAccessObject(const MetadataAccessObject&) = delete;
  MetadataAccessObject& operator=(const MetadataAccessObject&) = delete;

  // Initializes the metadata source and creates schema. Any existing data in
  // the MetadataSource is dropped.
  // Returns detailed INTERNAL error, if query execution fails.
  virtual absl::Status InitMetadataSource() = 0;

  // Initializes the metadata source and creates schema.
  // Changes not in effect until transaction is COMMITTED.
  // Returns OK and does nothing, if all required schema exist.
  // Returns OK and creates schema, if no schema exists yet.
  // Returns DATA_LOSS error, if the OciEnv has more than one schema version.
  // Returns ABORTED error, if any required schema is missing.
  // Returns FAILED_PRECONDITION error, if library and db have incompatible
  //   schema versions, and upgrade migrations are not enabled.
  // Returns detailed INTERNAL error, if create schema query execution fails.
  virtual absl::Status InitMetadataSourceIfNotExists(
      bool enable_upgrade_migration = false) = 0;

  // Deletes the metadata source.
  // Returns detailed INTERNAL error, if query execution fails.
  virtual absl::Status DeleteMetadataSource() = 0;

  // Downgrades the schema to `to_schema_version` in the given metadata source.
  // Returns INVALID_ARGUMENT, if `to_schema_version` is older than the oldest
  //   supported version, or newer than the library version.
  // Returns FAILED_PRECONDITION, if db schema version is newer than the
  //   library version.
  // Returns detailed INTERNAL error, if query execution fails.
  virtual absl::Status DowngradeMetadataSource(int64_t to_schema_version) = 0;

  // Gets the schema version of the database.
  // Returns NOT_FOUND error, if the database is empty.
  virtual absl::Status GetSchemaVersion(int64_t* db_version) = 0;

  // Creates an image, returns the assigned image id. The id field of the
  // given image is ignored, and the reference is stored as given.
  // Returns INVALID_ARGUMENT error, if the reference is not given.
  // Returns ALREADY_EXISTS error, if the reference is already stored.
  // Returns detailed INTERNAL error, if query execution fails.
  virtual absl::Status CreateImage(const Image& image, int64_t* image_id) = 0;

  // Sets the size of a stored image and marks it as used now.
  // Returns INVALID_ARGUMENT error, if the id is not given.
  // Returns NOT_FOUND error, if the image cannot be found.
  // Returns detailed INTERNAL error, if query execution fails.
  virtual absl::Status UpdateImage(const Image& image) = 0;

  // Gets images by ids, ordered by id.
  // Returns NOT_FOUND error, if any of the images cannot be found.
  // Returns detailed INTERNAL error, if query execution fails.
  virtual absl::Status FindImagesById(absl::Span<const int64_t> image_ids,
                                      std::vector<Image>* images) = 0;

  // Gets the image stored under the canonical `reference`.
  // Returns NOT_FOUND error, if the image cannot be found.
  // Returns detailed INTERNAL error, if query execution fails.
  virtual absl::Status FindImageByReference(absl::string_view reference,
                                            Image* image) = 0;

  // Deletes images by ids together with their manifests.
  // Returns detailed INTERNAL error, if query execution fails.
  virtual absl::Status DeleteImagesById(
      absl::Span<const int64_t> image_ids) = 0;

  // Creates a manifest, returns the assigned manifest id. The id field of the
  // given manifest is ignored.
  // Returns INVALID_ARGUMENT error, if image_id or media_type is not given.
  // Returns detailed INTERNAL error, if the image does not exist or query
  //   execution fails.
  virtual absl::Status CreateManifest(const Manifest& manifest,
                                      int64_t* manifest_id) = 0;

  // Gets manifests by ids, ordered by id.
  // Returns NOT_FOUND error, if any of the manifests cannot be found.
  // Returns detailed INTERNAL error, if query execution fails.
  virtual absl::Status FindManifestsById(
      absl::Span<const int64_t> manifest_ids,
      std::vector<Manifest>* manifests) = 0;

  // Gets the manifests of an image, ordered by id.
  // Returns detailed INTERNAL error, if query execution fails.
  virtual absl::Status FindManifestsByImageId(
      int64_t image_id, std::vector<Manifest>* manifests) = 0;
};

}  // namespace oci_metadata

#endif  // OCI_METADATA_METADATA_STORE_METADATA_ACCESS_OBJECT_H_
