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

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"

namespace oci_metadata {
namespace {

using ::testing::HasSubstr;

const std::string kSha256Digest =
    absl::StrCat("sha256:", std::string(64, 'a'));

TEST(ParseImageReferenceTest, OfficialImageGetsDefaults) {
  absl::StatusOr<ImageReference> parsed = ParseImageReference("alpine");
  ASSERT_EQ(absl::OkStatus(), parsed.status());
  EXPECT_EQ(parsed->registry, "docker.io");
  EXPECT_EQ(parsed->repository, "library/alpine");
  EXPECT_EQ(parsed->tag, "latest");
  EXPECT_EQ(parsed->digest, "");
  EXPECT_EQ(parsed->ToString(), "docker.io/library/alpine:latest");
}

TEST(ParseImageReferenceTest, RegistryWithPort) {
  absl::StatusOr<ImageReference> parsed =
      ParseImageReference("localhost:5000/team/app:1.2");
  ASSERT_EQ(absl::OkStatus(), parsed.status());
  EXPECT_EQ(parsed->registry, "localhost:5000");
  EXPECT_EQ(parsed->repository, "team/app");
  EXPECT_EQ(parsed->tag, "1.2");
}

TEST(ParseImageReferenceTest, LocalhostWithoutPort) {
  absl::StatusOr<ImageReference> parsed = ParseImageReference("localhost/app");
  ASSERT_EQ(absl::OkStatus(), parsed.status());
  EXPECT_EQ(parsed->registry, "localhost");
  EXPECT_EQ(parsed->repository, "app");
  EXPECT_EQ(parsed->tag, "latest");
}

TEST(ParseImageReferenceTest, DigestOnlyHasNoTag) {
  absl::StatusOr<ImageReference> parsed =
      ParseImageReference(absl::StrCat("ghcr.io/org/tool@", kSha256Digest));
  ASSERT_EQ(absl::OkStatus(), parsed.status());
  EXPECT_EQ(parsed->registry, "ghcr.io");
  EXPECT_EQ(parsed->repository, "org/tool");
  EXPECT_EQ(parsed->tag, "");
  EXPECT_EQ(parsed->digest, kSha256Digest);
  EXPECT_EQ(parsed->ToString(), absl::StrCat("ghcr.io/org/tool@",
                                             kSha256Digest));
}

TEST(ParseImageReferenceTest, TagAndDigest) {
  absl::StatusOr<ImageReference> parsed =
      ParseImageReference(absl::StrCat("busybox:1.36@", kSha256Digest));
  ASSERT_EQ(absl::OkStatus(), parsed.status());
  EXPECT_EQ(parsed->ToString(), absl::StrCat("docker.io/library/busybox:1.36@",
                                             kSha256Digest));
}

TEST(CanonicalizeImageReferenceTest, SpellingsOfOneImageAgree) {
  for (const char* spelling :
       {"alpine", "alpine:latest", "library/alpine",
        "docker.io/library/alpine", "index.docker.io/library/alpine:latest"}) {
    absl::StatusOr<std::string> canonical =
        CanonicalizeImageReference(spelling);
    ASSERT_EQ(absl::OkStatus(), canonical.status()) << spelling;
    EXPECT_EQ(*canonical, "docker.io/library/alpine:latest") << spelling;
  }
}

TEST(CanonicalizeImageReferenceTest, UserRepositoryKeepsItsNamespace) {
  absl::StatusOr<std::string> canonical =
      CanonicalizeImageReference("someuser/app:v2");
  ASSERT_EQ(absl::OkStatus(), canonical.status());
  EXPECT_EQ(*canonical, "docker.io/someuser/app:v2");
}

TEST(ParseImageReferenceTest, InvalidReferences) {
  for (const std::string& reference :
       {std::string(""), std::string("Alpine"), std::string("alpine:"),
        std::string("alpine:-bad"), std::string("alpine@sha256:abc"),
        absl::StrCat("alpine@sha256:", std::string(64, 'A')),
        std::string("alpine@nodigest"), std::string(":latest"),
        std::string("team//app"), std::string(256, 'a')}) {
    absl::StatusOr<ImageReference> parsed = ParseImageReference(reference);
    EXPECT_TRUE(absl::IsInvalidArgument(parsed.status())) << reference;
    EXPECT_THAT(std::string(parsed.status().message()),
                HasSubstr("Invalid image reference"));
  }
}

TEST(ParseImageReferenceTest, ErrorNamesTheReason) {
  EXPECT_THAT(
      std::string(ParseImageReference("alpine@sha256:abc").status().message()),
      HasSubstr("malformed digest"));
  EXPECT_THAT(std::string(ParseImageReference(absl::StrCat(
                                                  "alpine@sha256:",
                                                  std::string(64, 'A')))
                              .status()
                              .message()),
              HasSubstr("64 lowercase hex"));
  EXPECT_THAT(
      std::string(ParseImageReference("Alpine").status().message()),
      HasSubstr("malformed repository component 'Alpine'"));
}

}  // namespace
}  // namespace oci_metadata
