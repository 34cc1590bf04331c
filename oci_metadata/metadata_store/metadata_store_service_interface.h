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
#ifndef OCI_METADATA_METADATA_STORE_METADATA_STORE_SERVICE_INTERFACE_H_
#define OCI_METADATA_METADATA_STORE_METADATA_STORE_SERVICE_INTERFACE_H_

#include "absl/status/status.h"
#include "oci_metadata/proto/metadata_store_service.pb.h"

namespace oci_metadata {

// An interface for calling MetadataStoreService methods. This interface hides
// the details of the backend. Implementations must ensure that each method is
// an atomic operation.
class MetadataStoreServiceInterface {
 public:
  virtual ~MetadataStoreServiceInterface() {}

#define METADATA_STORE_SERVICE_INTERFACE_DECLARE(method)      \
  virtual absl::Status method(const method##Request& request, \
                              method##Response* response) {   \
    return absl::UnimplementedError(#method);                 \
  }

  METADATA_STORE_SERVICE_INTERFACE_DECLARE(PutImage)
  METADATA_STORE_SERVICE_INTERFACE_DECLARE(GetImageByReference)
  METADATA_STORE_SERVICE_INTERFACE_DECLARE(PutManifests)
  METADATA_STORE_SERVICE_INTERFACE_DECLARE(GetManifestsByImage)
  METADATA_STORE_SERVICE_INTERFACE_DECLARE(DeleteImage)
  METADATA_STORE_SERVICE_INTERFACE_DECLARE(GetSchemaVersion)

#undef METADATA_STORE_SERVICE_INTERFACE_DECLARE
};

}  // namespace oci_metadata

#endif  // OCI_METADATA_METADATA_STORE_METADATA_STORE_SERVICE_INTERFACE_H_
