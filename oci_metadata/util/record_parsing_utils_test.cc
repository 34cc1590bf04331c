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
#include "oci_metadata/util/record_parsing_utils.h"

#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "oci_metadata/metadata_store/test_util.h"
#include "oci_metadata/proto/metadata_source.pb.h"
#include "oci_metadata/proto/metadata_store.pb.h"

namespace oci_metadata {
namespace testing {
namespace {

using ::oci_metadata::testing::EqualsProto;
using ::oci_metadata::testing::ParseTextProtoOrDie;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(ParseRecordSetTest, ParseRecordSetToImageArraySuccess) {
  RecordSet record_set = ParseTextProtoOrDie<RecordSet>(
      R"pb(
        column_names: 'id'
        column_names: 'reference'
        column_names: 'size_bytes'
        column_names: 'last_used_at'
        column_names: 'created_at'
        column_names: 'modified_at'
        records {
          values: '1'
          values: 'docker.io/library/alpine:latest'
          values: '7340032'
          values: '__OCIMD_NULL__'
          values: '2026-01-02 03:04:05'
          values: '2026-01-02 03:04:05'
        }
        records {
          values: '2'
          values: 'ghcr.io/org/tool:v1'
          values: '__OCIMD_NULL__'
          values: '2026-02-01 00:00:00'
          values: '2026-01-31 10:00:00'
          values: '2026-02-01 00:00:00'
        }
      )pb");

  std::vector<Image> images;
  absl::Status status = ParseRecordSetToImageArray(record_set, images);
  EXPECT_EQ(status, absl::OkStatus());
  EXPECT_THAT(images,
              ElementsAre(EqualsProto(ParseTextProtoOrDie<Image>(R"pb(
                            id: 1
                            reference: 'docker.io/library/alpine:latest'
                            size_bytes: 7340032
                            created_at: '2026-01-02 03:04:05'
                            modified_at: '2026-01-02 03:04:05'
                          )pb")),
                          EqualsProto(ParseTextProtoOrDie<Image>(R"pb(
                            id: 2
                            reference: 'ghcr.io/org/tool:v1'
                            last_used_at: '2026-02-01 00:00:00'
                            created_at: '2026-01-31 10:00:00'
                            modified_at: '2026-02-01 00:00:00'
                          )pb"))));
}

TEST(ParseRecordSetTest, ParseRecordSetToManifestArraySkipsUnknownColumns) {
  // A database still at schema version 1 also returns index_id.
  RecordSet record_set = ParseTextProtoOrDie<RecordSet>(
      R"pb(
        column_names: 'id'
        column_names: 'image_id'
        column_names: 'index_id'
        column_names: 'schema_version'
        column_names: 'media_type'
        column_names: 'annotations_json'
        records {
          values: '5'
          values: '1'
          values: '3'
          values: '2'
          values: 'application/vnd.oci.image.manifest.v1+json'
          values: '{"a":"b"}'
        }
      )pb");

  std::vector<Manifest> manifests;
  EXPECT_EQ(ParseRecordSetToManifestArray(record_set, manifests),
            absl::OkStatus());
  EXPECT_THAT(manifests,
              ElementsAre(EqualsProto(ParseTextProtoOrDie<Manifest>(R"pb(
                id: 5
                image_id: 1
                schema_version: 2
                media_type: 'application/vnd.oci.image.manifest.v1+json'
                annotations_json: '{"a":"b"}'
              )pb"))));
}

TEST(ParseRecordSetTest, EmptyRecordSet) {
  RecordSet record_set = ParseTextProtoOrDie<RecordSet>(
      R"pb(
        column_names: 'id' column_names: 'reference'
      )pb");
  std::vector<Image> images;
  EXPECT_EQ(ParseRecordSetToImageArray(record_set, images), absl::OkStatus());
  EXPECT_THAT(images, IsEmpty());
}

TEST(ParseRecordSetTest, MalformedIntegerIsInternalError) {
  RecordSet record_set = ParseTextProtoOrDie<RecordSet>(
      R"pb(
        column_names: 'id'
        column_names: 'size_bytes'
        records { values: '1' values: 'big' }
      )pb");
  std::vector<Image> images;
  EXPECT_TRUE(
      absl::IsInternal(ParseRecordSetToImageArray(record_set, images)));
}

TEST(ParseValueToFieldTest, UnsupportedFieldTypes) {
  MetadataSourceQueryConfig config;
  const google::protobuf::Descriptor* descriptor = config.descriptor();
  EXPECT_TRUE(absl::IsInternal(ParseValueToField(
      descriptor->FindFieldByName("metadata_source_type"), "1", config)));
  EXPECT_TRUE(absl::IsInternal(ParseValueToField(
      descriptor->FindFieldByName("secondary_indices"), "x", config)));
  // NULL leaves any field unset.
  EXPECT_EQ(ParseValueToField(
                descriptor->FindFieldByName("metadata_source_type"),
                "__OCIMD_NULL__", config),
            absl::OkStatus());
  EXPECT_FALSE(config.has_metadata_source_type());
}

}  // namespace
}  // namespace testing
}  // namespace oci_metadata
