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
#ifndef OCI_METADATA_UTIL_REFERENCE_UTILS_H_
#define OCI_METADATA_UTIL_REFERENCE_UTILS_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace oci_metadata {

// The registry used when a reference does not name one.
constexpr absl::string_view kDefaultRegistry = "docker.io";

// The tag used when a reference has neither a tag nor a digest.
constexpr absl::string_view kDefaultTag = "latest";

// An OCI image reference, `[registry/]repository[:tag][@digest]`, with the
// defaults filled in.
struct ImageReference {
  std::string registry;
  std::string repository;
  // Empty when the reference is pinned by digest only.
  std::string tag;
  // Empty when absent, otherwise `algorithm:hex`.
  std::string digest;

  // Returns `registry/repository[:tag][@digest]`.
  std::string ToString() const;
};

// Parses `reference`. The first path component is the registry when it
// contains a '.' or a ':', or is `localhost`; otherwise the registry is
// docker.io, where single component repositories get the `library/` prefix.
// Returns INVALID_ARGUMENT if the reference is malformed.
absl::StatusOr<ImageReference> ParseImageReference(absl::string_view reference);

// Returns the canonical string of `reference`, the key of an image in the
// store. Different spellings of one image share one canonical string, e.g.,
// `alpine` and `docker.io/library/alpine:latest`.
// Returns INVALID_ARGUMENT if the reference is malformed.
absl::StatusOr<std::string> CanonicalizeImageReference(
    absl::string_view reference);

}  // namespace oci_metadata

#endif  // OCI_METADATA_UTIL_REFERENCE_UTILS_H_
