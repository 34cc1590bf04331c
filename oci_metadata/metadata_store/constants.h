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
#ifndef OCI_METADATA_METADATA_STORE_CONSTANTS_H_
#define OCI_METADATA_METADATA_STORE_CONSTANTS_H_

#include <cstdint>

#include "absl/strings/string_view.h"

namespace oci_metadata {

// The in-memory encoding of the NULL value in RecordSet proto returned from
// any MetadataSource.
static constexpr absl::string_view kMetadataSourceNull = "__OCIMD_NULL__";

// The suffix of the staging table used while a table is rebuilt.
static constexpr absl::string_view kShadowTableSuffix = "_new";

// The lowest schema version the library can downgrade to.
constexpr int64_t kMinimumSchemaVersion = 1;

}  // namespace oci_metadata

#endif  // OCI_METADATA_METADATA_STORE_CONSTANTS_H_
