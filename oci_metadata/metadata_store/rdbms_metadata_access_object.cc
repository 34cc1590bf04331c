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
#include "oci_metadata/metadata_store/rdbms_metadata_access_object.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "oci_metadata/proto/metadata_source.pb.h"
#include "oci_metadata/util/record_parsing_utils.h"
#include "oci_metadata/util/return_utils.h"

namespace oci_metadata {

namespace {

// Returns true when the status error message indicates a unique constraint is
// violated.
bool IsUniqueConstraintViolated(const absl::Status& status) {
  return absl::IsInternal(status) &&
         absl::StrContains(status.message(), "UNIQUE");
}

// Returns NOT_FOUND when fewer rows than distinct requested ids are found.
absl::Status CheckAllFound(absl::string_view kind,
                           absl::Span<const int64_t> ids, int found) {
  const absl::flat_hash_set<int64_t> distinct_ids(ids.begin(), ids.end());
  if (found == static_cast<int>(distinct_ids.size())) return absl::OkStatus();
  return absl::NotFoundError(absl::StrCat("Results missing for ", kind,
                                          " ids: ", absl::StrJoin(ids, ",")));
}

}  // namespace

absl::Status RdbmsMetadataAccessObject::CreateImage(const Image& image,
                                                    int64_t* image_id) {
  if (image.reference().empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Image has no reference: ", image.DebugString()));
  }
  const absl::Status status =
      executor_->InsertImage(image.reference(), image.size_bytes(), image_id);
  if (IsUniqueConstraintViolated(status)) {
    return absl::AlreadyExistsError(absl::StrCat(
        "Given image already exists: ", image.reference(), " ",
        status.ToString()));
  }
  return status;
}

absl::Status RdbmsMetadataAccessObject::UpdateImage(const Image& image) {
  if (!image.has_id()) {
    return absl::InvalidArgumentError(
        absl::StrCat("No id is given: ", image.DebugString()));
  }
  std::vector<Image> stored;
  OCIMD_RETURN_IF_ERROR(FindImagesById({image.id()}, &stored));
  return executor_->TouchImage(image.id(), image.size_bytes());
}

absl::Status RdbmsMetadataAccessObject::FindImagesById(
    absl::Span<const int64_t> image_ids, std::vector<Image>* images) {
  if (image_ids.empty()) {
    return absl::OkStatus();
  }
  RecordSet record_set;
  OCIMD_RETURN_IF_ERROR(executor_->SelectImagesByID(image_ids, &record_set));
  OCIMD_RETURN_IF_ERROR(
      CheckAllFound("image", image_ids, record_set.records_size()));
  return ParseRecordSetToImageArray(record_set, *images);
}

absl::Status RdbmsMetadataAccessObject::FindImageByReference(
    absl::string_view reference, Image* image) {
  RecordSet record_set;
  OCIMD_RETURN_IF_ERROR(
      executor_->SelectImageByReference(reference, &record_set));
  if (record_set.records_size() == 0) {
    return absl::NotFoundError(
        absl::StrCat("No image found with reference: ", reference));
  }
  std::vector<Image> images;
  OCIMD_RETURN_IF_ERROR(ParseRecordSetToImageArray(record_set, images));
  *image = images.front();
  return absl::OkStatus();
}

absl::Status RdbmsMetadataAccessObject::CreateManifest(
    const Manifest& manifest, int64_t* manifest_id) {
  if (!manifest.has_image_id()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Manifest has no image_id: ", manifest.DebugString()));
  }
  if (manifest.media_type().empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Manifest has no media_type: ", manifest.DebugString()));
  }
  return executor_->InsertManifest(
      manifest.image_id(), manifest.schema_version(), manifest.media_type(),
      manifest.has_annotations_json()
          ? std::make_optional<absl::string_view>(manifest.annotations_json())
          : std::nullopt,
      manifest_id);
}

absl::Status RdbmsMetadataAccessObject::FindManifestsById(
    absl::Span<const int64_t> manifest_ids, std::vector<Manifest>* manifests) {
  if (manifest_ids.empty()) {
    return absl::OkStatus();
  }
  RecordSet record_set;
  OCIMD_RETURN_IF_ERROR(
      executor_->SelectManifestsByID(manifest_ids, &record_set));
  OCIMD_RETURN_IF_ERROR(
      CheckAllFound("manifest", manifest_ids, record_set.records_size()));
  return ParseRecordSetToManifestArray(record_set, *manifests);
}

absl::Status RdbmsMetadataAccessObject::FindManifestsByImageId(
    int64_t image_id, std::vector<Manifest>* manifests) {
  RecordSet record_set;
  OCIMD_RETURN_IF_ERROR(
      executor_->SelectManifestsByImageID(image_id, &record_set));
  return ParseRecordSetToManifestArray(record_set, *manifests);
}

}  // namespace oci_metadata
