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
#include "oci_metadata/metadata_store/metadata_access_object_factory.h"

#include <memory>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "oci_metadata/metadata_store/query_config_executor.h"
#include "oci_metadata/metadata_store/rdbms_metadata_access_object.h"
#include "oci_metadata/proto/metadata_source.pb.h"
#include "oci_metadata/util/return_utils.h"

namespace oci_metadata {

absl::Status CreateMetadataAccessObject(
    const MetadataSourceQueryConfig& query_config,
    MetadataSource* const metadata_source,
    std::unique_ptr<MetadataAccessObject>* result) {
  if (metadata_source == nullptr) {
    return absl::InvalidArgumentError("No metadata source is given.");
  }
  switch (query_config.metadata_source_type()) {
    case SQLITE_METADATA_SOURCE: {
      if (!metadata_source->is_connected())
        OCIMD_RETURN_IF_ERROR(metadata_source->Connect());
      std::unique_ptr<QueryExecutor> executor = absl::WrapUnique(
          new QueryConfigExecutor(query_config, metadata_source));
      *result =
          absl::WrapUnique(new RdbmsMetadataAccessObject(std::move(executor)));
      return absl::OkStatus();
    }
    default:
      return absl::InvalidArgumentError(absl::StrCat(
          "Unknown Metadata source type: ",
          MetadataSourceType_Name(query_config.metadata_source_type())));
  }
}

}  // namespace oci_metadata
