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
#ifndef OCI_METADATA_METADATA_STORE_METADATA_STORE_H_
#define OCI_METADATA_METADATA_STORE_METADATA_STORE_H_

#include <memory>

#include "absl/status/status.h"
#include "oci_metadata/metadata_store/metadata_access_object.h"
#include "oci_metadata/metadata_store/metadata_source.h"
#include "oci_metadata/metadata_store/metadata_store_service_interface.h"
#include "oci_metadata/metadata_store/transaction_executor.h"
#include "oci_metadata/proto/metadata_source.pb.h"
#include "oci_metadata/proto/metadata_store.pb.h"
#include "oci_metadata/proto/metadata_store_service.pb.h"

namespace oci_metadata {

// A store of pulled image metadata.
// Implements the API specified in MetadataStoreServiceInterface.
// Each method is an atomic operation.
class MetadataStore : public MetadataStoreServiceInterface {
 public:
  // Factory method that creates a MetadataStore in result. The result is owned
  // by the caller, and metadata_source is owned by result.
  // If the return value is ok, 'result' is populated with an object that can be
  // used to access metadata with the given config and metadata_source.
  // Returns INVALID_ARGUMENT error, if query_config is not valid.
  // Returns INVALID_ARGUMENT error, if migration options are invalid.
  // Returns CANCELLED error, if downgrade migration is performed.
  // Returns detailed INTERNAL error, if the MetadataSource cannot be connected.
  static absl::Status Create(
      const MetadataSourceQueryConfig& query_config,
      const MigrationOptions& migration_options,
      std::unique_ptr<MetadataSource> metadata_source,
      std::unique_ptr<TransactionExecutor> transaction_executor,
      std::unique_ptr<MetadataStore>* result);

  // Initializes the metadata source and creates schema. Any existing data in
  // the metadata is dropped.
  // Returns detailed INTERNAL error, if query execution fails.
  absl::Status InitMetadataStore();

  // Initializes the metadata source and creates schema if it does not exist.
  // An older schema is upgraded in a single transaction when
  // `enable_upgrade_migration` is set.
  // Returns OK and does nothing, if all required schema exist.
  // Returns OK and creates schema, if no schema exists yet.
  // Returns ABORTED error, if any required schema is missing.
  // Returns FAILED_PRECONDITION error, if library and db have incompatible
  //   schema versions, and upgrade migrations are not enabled.
  // Returns detailed INTERNAL error, if create schema query execution fails.
  absl::Status InitMetadataStoreIfNotExists(
      bool enable_upgrade_migration = false);

  // Stores an image under its canonical reference. If the reference is
  // already stored, its size_bytes and last_used_at are refreshed and its id
  // is returned.
  // Returns INVALID_ARGUMENT error, if no image is given, or its reference is
  //   malformed.
  // Returns detailed INTERNAL error, if query execution fails.
  absl::Status PutImage(const PutImageRequest& request,
                        PutImageResponse* response) override;

  // Gets an image by any accepted spelling of its reference.
  // Returns INVALID_ARGUMENT error, if the reference is malformed.
  // Returns NOT_FOUND error, if no image is stored under the reference.
  // Returns detailed INTERNAL error, if query execution fails.
  absl::Status GetImageByReference(
      const GetImageByReferenceRequest& request,
      GetImageByReferenceResponse* response) override;

  // Inserts manifests atomically, and returns their ids in request order.
  // Returns INVALID_ARGUMENT error, if a manifest has no image_id or
  //   media_type.
  // Returns detailed INTERNAL error, if an image_id is not stored, or query
  //   execution fails.
  absl::Status PutManifests(const PutManifestsRequest& request,
                            PutManifestsResponse* response) override;

  // Gets the manifests of an image, ordered by id.
  // Returns detailed INTERNAL error, if query execution fails.
  absl::Status GetManifestsByImage(
      const GetManifestsByImageRequest& request,
      GetManifestsByImageResponse* response) override;

  // Deletes an image and, through the cascade, its manifests.
  // Returns NOT_FOUND error, if the image does not exist.
  // Returns detailed INTERNAL error, if query execution fails.
  absl::Status DeleteImage(const DeleteImageRequest& request,
                           DeleteImageResponse* response) override;

  // Returns the schema version of the database.
  // Returns NOT_FOUND error, if the database is empty.
  absl::Status GetSchemaVersion(const GetSchemaVersionRequest& request,
                                GetSchemaVersionResponse* response) override;

 private:
  // To construct the object, see Create(...).
  MetadataStore(std::unique_ptr<MetadataSource> metadata_source,
                std::unique_ptr<MetadataAccessObject> metadata_access_object,
                std::unique_ptr<TransactionExecutor> transaction_executor);

  std::unique_ptr<MetadataSource> metadata_source_;
  std::unique_ptr<MetadataAccessObject> metadata_access_object_;
  std::unique_ptr<TransactionExecutor> transaction_executor_;
};

}  // namespace oci_metadata

#endif  // OCI_METADATA_METADATA_STORE_METADATA_STORE_H_
