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
#ifndef OCI_METADATA_METADATA_STORE_METADATA_STORE_FACTORY_H_
#define OCI_METADATA_METADATA_STORE_METADATA_STORE_FACTORY_H_

#include <memory>

#include "absl/status/status.h"
#include "oci_metadata/metadata_store/metadata_store.h"
#include "oci_metadata/proto/metadata_store.pb.h"

namespace oci_metadata {

// Creates a MetadataStore, and creates or upgrades its schema as allowed by
// `options`.
// If the method returns OK, the method MUST set result to contain
// a non-null pointer. Otherwise result is left untouched.
// Returns CANCELLED error, if a downgrade migration was performed.
absl::Status CreateMetadataStore(const ConnectionConfig& config,
                                 const MigrationOptions& options,
                                 std::unique_ptr<MetadataStore>* result);

// Creates a MetadataStore with default migration options.
absl::Status CreateMetadataStore(const ConnectionConfig& config,
                                 std::unique_ptr<MetadataStore>* result);

}  // namespace oci_metadata

#endif  // OCI_METADATA_METADATA_STORE_METADATA_STORE_FACTORY_H_
