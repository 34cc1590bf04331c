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
#include "oci_metadata/metadata_store/metadata_store.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <glog/logging.h>
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "oci_metadata/metadata_store/metadata_access_object.h"
#include "oci_metadata/metadata_store/metadata_access_object_factory.h"
#include "oci_metadata/metadata_store/metadata_source.h"
#include "oci_metadata/proto/metadata_store.pb.h"
#include "oci_metadata/proto/metadata_store_service.pb.h"
#include "oci_metadata/util/reference_utils.h"
#include "oci_metadata/util/return_utils.h"

namespace oci_metadata {
namespace {
using std::unique_ptr;

// Stores `image` under its canonical reference, refreshing the stored row if
// the reference is already known. Returns the id of the stored image.
absl::Status UpsertImage(const Image& image,
                         MetadataAccessObject* metadata_access_object,
                         int64_t* image_id) {
  OCIMD_ASSIGN_OR_RETURN(const std::string reference,
                         CanonicalizeImageReference(image.reference()));
  Image stored_image;
  const absl::Status status =
      metadata_access_object->FindImageByReference(reference, &stored_image);
  if (status.ok()) {
    stored_image.set_size_bytes(image.size_bytes());
    OCIMD_RETURN_IF_ERROR(metadata_access_object->UpdateImage(stored_image));
    *image_id = stored_image.id();
    return absl::OkStatus();
  }
  if (!absl::IsNotFound(status)) {
    return status;
  }
  Image new_image = image;
  new_image.set_reference(reference);
  return metadata_access_object->CreateImage(new_image, image_id);
}

}  // namespace

absl::Status MetadataStore::InitMetadataStore() {
  TransactionOptions options;
  options.set_tag("InitMetadataStore");
  return transaction_executor_->Execute(
      [this]() -> absl::Status {
        return metadata_access_object_->InitMetadataSource();
      },
      options);
}

absl::Status MetadataStore::InitMetadataStoreIfNotExists(
    const bool enable_upgrade_migration) {
  TransactionOptions options;
  options.set_tag("InitMetadataStoreIfNotExists");
  return transaction_executor_->Execute(
      [this, &enable_upgrade_migration]() -> absl::Status {
        return metadata_access_object_->InitMetadataSourceIfNotExists(
            enable_upgrade_migration);
      },
      options);
}

absl::Status MetadataStore::PutImage(const PutImageRequest& request,
                                     PutImageResponse* response) {
  if (!request.has_image()) {
    return absl::InvalidArgumentError("No image is given to put.");
  }
  return transaction_executor_->Execute(
      [this, &request, &response]() -> absl::Status {
        response->Clear();
        int64_t image_id = -1;
        OCIMD_RETURN_IF_ERROR(UpsertImage(
            request.image(), metadata_access_object_.get(), &image_id));
        response->set_image_id(image_id);
        return absl::OkStatus();
      },
      request.transaction_options());
}

absl::Status MetadataStore::GetImageByReference(
    const GetImageByReferenceRequest& request,
    GetImageByReferenceResponse* response) {
  return transaction_executor_->Execute(
      [this, &request, &response]() -> absl::Status {
        response->Clear();
        OCIMD_ASSIGN_OR_RETURN(const std::string reference,
                               CanonicalizeImageReference(request.reference()));
        return metadata_access_object_->FindImageByReference(
            reference, response->mutable_image());
      },
      request.transaction_options());
}

absl::Status MetadataStore::PutManifests(const PutManifestsRequest& request,
                                         PutManifestsResponse* response) {
  return transaction_executor_->Execute(
      [this, &request, &response]() -> absl::Status {
        response->Clear();
        for (const Manifest& manifest : request.manifests()) {
          int64_t manifest_id = -1;
          OCIMD_RETURN_IF_ERROR(
              metadata_access_object_->CreateManifest(manifest, &manifest_id));
          response->add_manifest_ids(manifest_id);
        }
        return absl::OkStatus();
      },
      request.transaction_options());
}

absl::Status MetadataStore::GetManifestsByImage(
    const GetManifestsByImageRequest& request,
    GetManifestsByImageResponse* response) {
  return transaction_executor_->Execute(
      [this, &request, &response]() -> absl::Status {
        response->Clear();
        std::vector<Manifest> manifests;
        OCIMD_RETURN_IF_ERROR(metadata_access_object_->FindManifestsByImageId(
            request.image_id(), &manifests));
        for (Manifest& manifest : manifests) {
          *response->add_manifests() = std::move(manifest);
        }
        return absl::OkStatus();
      },
      request.transaction_options());
}

absl::Status MetadataStore::DeleteImage(const DeleteImageRequest& request,
                                        DeleteImageResponse* response) {
  return transaction_executor_->Execute(
      [this, &request, &response]() -> absl::Status {
        response->Clear();
        std::vector<Image> images;
        OCIMD_RETURN_IF_ERROR(metadata_access_object_->FindImagesById(
            {request.image_id()}, &images));
        VLOG(1) << "Deleting image " << images.front().reference();
        return metadata_access_object_->DeleteImagesById({request.image_id()});
      },
      request.transaction_options());
}

absl::Status MetadataStore::GetSchemaVersion(
    const GetSchemaVersionRequest& request,
    GetSchemaVersionResponse* response) {
  return transaction_executor_->Execute(
      [this, &response]() -> absl::Status {
        response->Clear();
        int64_t schema_version = -1;
        OCIMD_RETURN_IF_ERROR(
            metadata_access_object_->GetSchemaVersion(&schema_version));
        response->set_schema_version(schema_version);
        return absl::OkStatus();
      },
      request.transaction_options());
}

absl::Status MetadataStore::Create(
    const MetadataSourceQueryConfig& query_config,
    const MigrationOptions& migration_options,
    unique_ptr<MetadataSource> metadata_source,
    unique_ptr<TransactionExecutor> transaction_executor,
    unique_ptr<MetadataStore>* result) {
  unique_ptr<MetadataAccessObject> metadata_access_object;
  OCIMD_RETURN_IF_ERROR(CreateMetadataAccessObject(
      query_config, metadata_source.get(), &metadata_access_object));
  // if downgrade migration is specified
  if (migration_options.downgrade_to_schema_version() >= 0) {
    TransactionOptions options;
    options.set_tag("DowngradeMetadataSource");
    OCIMD_RETURN_IF_ERROR(transaction_executor->Execute(
        [&migration_options, &metadata_access_object]() -> absl::Status {
          return metadata_access_object->DowngradeMetadataSource(
              migration_options.downgrade_to_schema_version());
        },
        options));
    return absl::CancelledError(absl::StrCat(
        "Downgrade migration was performed. Connection to the downgraded "
        "database is Cancelled. Now the database is at schema version ",
        migration_options.downgrade_to_schema_version(),
        ". Use a lower version of the library to connect to the metadata "
        "store."));
  }
  *result = absl::WrapUnique(new MetadataStore(
      std::move(metadata_source), std::move(metadata_access_object),
      std::move(transaction_executor)));
  return absl::OkStatus();
}

MetadataStore::MetadataStore(
    std::unique_ptr<MetadataSource> metadata_source,
    std::unique_ptr<MetadataAccessObject> metadata_access_object,
    std::unique_ptr<TransactionExecutor> transaction_executor)
    : metadata_source_(std::move(metadata_source)),
      metadata_access_object_(std::move(metadata_access_object)),
      transaction_executor_(std::move(transaction_executor)) {}

}  // namespace oci_metadata
