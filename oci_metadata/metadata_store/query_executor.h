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
#ifndef OCI_METADATA_METADATA_STORE_QUERY_EXECUTOR_H_
#define OCI_METADATA_METADATA_STORE_QUERY_EXECUTOR_H_

#include <cstdint>
#include <optional>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "oci_metadata/proto/metadata_source.pb.h"

namespace oci_metadata {

// A class wrapping a low-level interface to a database.
// This contains both the queries and the method for executing them.
// Most methods correspond to one query, with a few exceptions
// (such as InitMetadataSource and the schema migrations).
//
// The Select{X} methods return a RecordSet with the columns:
// - Image: id, reference, size_bytes, last_used_at, created_at, modified_at
// - Manifest: id, image_id, schema_version, media_type, annotations_json,
//   created_at, modified_at
class QueryExecutor {
 public:
  QueryExecutor() = default;
  virtual ~QueryExecutor() = default;

  // copy constructors are disallowed.
  QueryExecutor(const QueryExecutor&) = delete;
  QueryExecutor& operator=(const QueryExecutor&) = delete;

  // Initializes the metadata source and creates schema. Any existing data in
  // the MetadataSource is dropped.
  // Returns detailed INTERNAL error, if query execution fails.
  virtual absl::Status InitMetadataSource() = 0;

  // Initializes the metadata source and creates schema if not exist.
  // Returns OK and does nothing, if all required schema exist.
  // Returns OK and creates schema, if no schema exists yet.
  // Returns DATA_LOSS error, if the OciEnv has more than one schema version.
  // Returns ABORTED error, if any required schema is missing.
  // Returns FAILED_PRECONDITION error, if library and db have incompatible
  //   schema versions, and upgrade migrations are not enabled.
  // Returns detailed INTERNAL error, if create schema query execution fails.
  virtual absl::Status InitMetadataSourceIfNotExists(
      bool enable_upgrade_migration = false) = 0;

  // Drops every table of the current schema.
  // Returns detailed INTERNAL error, if query execution fails.
  virtual absl::Status DeleteMetadataSource() = 0;

  // Upgrades the database schema version (db_v) to align with the library
  // schema version (lib_v). It retrieves db_v from the metadata source and
  // compares it with the lib_v in the given query_config, and runs migration
  // schemes if db_v < lib_v.
  // Returns FAILED_PRECONDITION error, if db_v > lib_v for the case that the
  //   user use a database produced by a newer version of the library.
  // Returns FAILED_PRECONDITION error, if db_v < lib_v and migration is
  //   disabled.
  // Returns detailed INTERNAL error, if query execution fails.
  virtual absl::Status UpgradeMetadataSourceIfOutOfDate(
      bool enable_migration) = 0;

  // Downgrades the schema to `to_schema_version` in the given metadata source.
  // Returns INVALID_ARGUMENT, if `to_schema_version` is less than the minimum
  //   schema version, or newer than the library version.
  // Returns INVALID_ARGUMENT, if the database is empty.
  // Returns FAILED_PRECONDITION, if db schema version is newer than the
  //   library version.
  // Returns detailed INTERNAL error, if query execution fails.
  virtual absl::Status DowngradeMetadataSource(int64_t to_schema_version) = 0;

  // Applies a declarative schema change within the current transaction.
  // Returns INVALID_ARGUMENT, if the schema change is malformed.
  // Returns detailed INTERNAL error, if a statement fails, e.g., a constraint
  //   violation while copying rows into a shadow table.
  virtual absl::Status ApplySchemaChange(const SchemaChange& schema_change) = 0;

  // Gets the schema version from the OciEnv table.
  // Returns NOT_FOUND error, if the database is empty.
  // Returns ABORTED error, if the OciEnv table exists but has no row.
  // Returns DATA_LOSS error, if the OciEnv table has more than one row.
  virtual absl::Status GetSchemaVersion(int64_t* db_version) = 0;

  // Checks the OciEnv table and query the schema version.
  virtual absl::Status CheckEnvTable() = 0;

  // Inserts the schema version.
  virtual absl::Status InsertSchemaVersion(int64_t schema_version) = 0;

  // Updates the schema version.
  virtual absl::Status UpdateSchemaVersion(int64_t schema_version) = 0;

  // Returns the schema version of the queries.
  virtual int64_t GetLibraryVersion() = 0;

  // Checks the existence of the images table.
  virtual absl::Status CheckImageTable() = 0;

  // Inserts an image with a canonical `reference`, and returns its id.
  // Returns detailed INTERNAL error, if the reference is already stored.
  virtual absl::Status InsertImage(absl::string_view reference,
                                   int64_t size_bytes, int64_t* image_id) = 0;

  // Sets the size of an image and marks it as used now.
  virtual absl::Status TouchImage(int64_t image_id, int64_t size_bytes) = 0;

  // Gets images by ids, ordered by id.
  virtual absl::Status SelectImagesByID(absl::Span<const int64_t> image_ids,
                                        RecordSet* record_set) = 0;

  // Gets the image with the canonical `reference`, if any.
  virtual absl::Status SelectImageByReference(absl::string_view reference,
                                              RecordSet* record_set) = 0;

  // Deletes images by ids. The manifests of the images are deleted by the
  // foreign key cascade.
  virtual absl::Status DeleteImagesById(
      absl::Span<const int64_t> image_ids) = 0;

  // Checks the existence of the manifests table.
  virtual absl::Status CheckManifestTable() = 0;

  // Inserts a manifest, and returns its id.
  // Returns detailed INTERNAL error, if `image_id` is not a stored image.
  virtual absl::Status InsertManifest(
      int64_t image_id, int64_t schema_version, absl::string_view media_type,
      std::optional<absl::string_view> annotations_json,
      int64_t* manifest_id) = 0;

  // Gets manifests by ids, ordered by id.
  virtual absl::Status SelectManifestsByID(
      absl::Span<const int64_t> manifest_ids, RecordSet* record_set) = 0;

  // Gets the manifests of an image, ordered by id.
  virtual absl::Status SelectManifestsByImageID(int64_t image_id,
                                                RecordSet* record_set) = 0;
};

}  // namespace oci_metadata

#endif  // OCI_METADATA_METADATA_STORE_QUERY_EXECUTOR_H_
