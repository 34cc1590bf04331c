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
#include "oci_metadata/util/reference_utils.h"

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "re2/re2.h"

namespace oci_metadata {
namespace {

constexpr absl::string_view kLegacyDefaultRegistry = "index.docker.io";
constexpr absl::string_view kOfficialRepositoryPrefix = "library/";
constexpr absl::string_view kLocalhost = "localhost";
constexpr int kMaxNameLength = 255;

// A hostname with an optional port.
constexpr char kRegistryRE[] =
    "(?:[a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9-]*[a-zA-Z0-9])"
    "(?:\\.(?:[a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9-]*[a-zA-Z0-9]))*"
    "(?::[0-9]+)?";
constexpr char kPathComponentRE[] = "[a-z0-9]+(?:(?:[._]|__|[-]+)[a-z0-9]+)*";
constexpr char kTagRE[] = "[\\w][\\w.-]{0,127}";
constexpr char kDigestRE[] =
    "[A-Za-z][A-Za-z0-9]*(?:[-_+.][A-Za-z][A-Za-z0-9]*)*:[0-9a-fA-F]{32,}";
constexpr char kSha256DigestRE[] = "sha256:[a-f0-9]{64}";

absl::Status InvalidReference(absl::string_view reference,
                              absl::string_view reason) {
  return absl::InvalidArgumentError(
      absl::StrCat("Invalid image reference '", reference, "': ", reason));
}

bool FullMatch(absl::string_view text, const RE2& re) {
  return RE2::FullMatch(re2::StringPiece(text.data(), text.size()), re);
}

bool IsRegistry(absl::string_view component) {
  return component == kLocalhost ||
         component.find_first_of(".:") != absl::string_view::npos;
}

}  // namespace

std::string ImageReference::ToString() const {
  std::string result = absl::StrCat(registry, "/", repository);
  if (!tag.empty()) absl::StrAppend(&result, ":", tag);
  if (!digest.empty()) absl::StrAppend(&result, "@", digest);
  return result;
}

absl::StatusOr<ImageReference> ParseImageReference(
    absl::string_view reference) {
  static const LazyRE2 registry_re = {kRegistryRE};
  static const LazyRE2 path_component_re = {kPathComponentRE};
  static const LazyRE2 tag_re = {kTagRE};
  static const LazyRE2 digest_re = {kDigestRE};
  static const LazyRE2 sha256_digest_re = {kSha256DigestRE};

  if (reference.empty()) return InvalidReference(reference, "empty");
  ImageReference result;

  absl::string_view name = reference;
  const size_t at = name.find('@');
  if (at != absl::string_view::npos) {
    const absl::string_view digest = name.substr(at + 1);
    if (!FullMatch(digest, *digest_re)) {
      return InvalidReference(reference, "malformed digest");
    }
    if (absl::StartsWith(digest, "sha256:") &&
        !FullMatch(digest, *sha256_digest_re)) {
      return InvalidReference(reference,
                              "sha256 digest needs 64 lowercase hex digits");
    }
    result.digest = std::string(digest);
    name = name.substr(0, at);
  }

  // A ':' after the last '/' starts the tag; an earlier one is a port.
  const size_t colon = name.rfind(':');
  const size_t slash = name.rfind('/');
  if (colon != absl::string_view::npos &&
      (slash == absl::string_view::npos || colon > slash)) {
    const absl::string_view tag = name.substr(colon + 1);
    if (!FullMatch(tag, *tag_re)) {
      return InvalidReference(reference, "malformed tag");
    }
    result.tag = std::string(tag);
    name = name.substr(0, colon);
  }
  if (name.empty()) return InvalidReference(reference, "missing repository");
  if (name.size() > kMaxNameLength) {
    return InvalidReference(reference, "name is too long");
  }

  std::vector<absl::string_view> components = absl::StrSplit(name, '/');
  if (components.size() > 1 && IsRegistry(components.front())) {
    if (!FullMatch(components.front(), *registry_re)) {
      return InvalidReference(reference, "malformed registry");
    }
    result.registry = std::string(components.front());
    components.erase(components.begin());
  } else {
    result.registry = std::string(kDefaultRegistry);
  }
  if (result.registry == kLegacyDefaultRegistry) {
    result.registry = std::string(kDefaultRegistry);
  }
  for (const absl::string_view component : components) {
    if (!FullMatch(component, *path_component_re)) {
      return InvalidReference(
          reference, absl::StrCat("malformed repository component '",
                                  component, "'"));
    }
  }
  result.repository = absl::StrJoin(components, "/");
  if (result.registry == kDefaultRegistry && components.size() == 1) {
    result.repository =
        absl::StrCat(kOfficialRepositoryPrefix, result.repository);
  }
  if (result.tag.empty() && result.digest.empty()) {
    result.tag = std::string(kDefaultTag);
  }
  return result;
}

absl::StatusOr<std::string> CanonicalizeImageReference(
    absl::string_view reference) {
  absl::StatusOr<ImageReference> parsed = ParseImageReference(reference);
  if (!parsed.ok()) return parsed.status();
  return parsed->ToString();
}

}  // namespace oci_metadata
