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
#ifndef OCI_METADATA_METADATA_STORE_QUERY_CONFIG_EXECUTOR_H_
#define OCI_METADATA_METADATA_STORE_QUERY_CONFIG_EXECUTOR_H_

#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/repeated_field.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "oci_metadata/metadata_store/metadata_source.h"
#include "oci_metadata/metadata_store/query_executor.h"
#include "oci_metadata/proto/metadata_source.pb.h"
#include "oci_metadata/util/return_utils.h"

namespace oci_metadata {

// A SQL version of the QueryExecutor. The text of the queries is encoded in
// MetadataSourceQueryConfig. This class binds the relevant arguments for each
// query using the Bind() methods.
class QueryConfigExecutor : public QueryExecutor {
 public:
  // Note that the query config and the MetadataSource must be compatible,
  // e.g., SqliteMetadataSource with util::GetSqliteMetadataSourceQueryConfig().
  //
  // The MetadataSource is not owned by this object, and must outlast it.
  QueryConfigExecutor(const MetadataSourceQueryConfig& query_config,
                      MetadataSource* source)
      : query_config_(query_config), metadata_source_(source) {}

  // default & copy constructors are disallowed.
  QueryConfigExecutor() = delete;
  QueryConfigExecutor(const QueryConfigExecutor&) = delete;
  QueryConfigExecutor& operator=(const QueryConfigExecutor&) = delete;

  ~QueryConfigExecutor() override = default;

  absl::Status InitMetadataSource() final;

  absl::Status InitMetadataSourceIfNotExists(
      bool enable_upgrade_migration = false) final;

  absl::Status DeleteMetadataSource() final;

  absl::Status UpgradeMetadataSourceIfOutOfDate(bool enable_migration) final;

  absl::Status DowngradeMetadataSource(int64_t to_schema_version) final;

  absl::Status ApplySchemaChange(const SchemaChange& schema_change) final;

  absl::Status GetSchemaVersion(int64_t* db_version) final;

  absl::Status CheckEnvTable() final {
    return ExecuteQuery(query_config_.check_env_table());
  }

  absl::Status InsertSchemaVersion(int64_t schema_version) final {
    return ExecuteQuery(query_config_.insert_schema_version(),
                        {Bind(schema_version)});
  }

  absl::Status UpdateSchemaVersion(int64_t schema_version) final {
    return ExecuteQuery(query_config_.update_schema_version(),
                        {Bind(schema_version)});
  }

  int64_t GetLibraryVersion() final { return query_config_.schema_version(); }

  absl::Status CheckImageTable() final {
    return ExecuteQuery(query_config_.check_image_table());
  }

  absl::Status InsertImage(absl::string_view reference, int64_t size_bytes,
                           int64_t* image_id) final {
    return ExecuteQuerySelectLastInsertID(
        query_config_.insert_image(), {Bind(reference), Bind(size_bytes)},
        image_id);
  }

  absl::Status TouchImage(int64_t image_id, int64_t size_bytes) final {
    return ExecuteQuery(query_config_.touch_image(),
                        {Bind(image_id), Bind(size_bytes)});
  }

  absl::Status SelectImagesByID(absl::Span<const int64_t> image_ids,
                                RecordSet* record_set) final {
    return ExecuteQuery(query_config_.select_images_by_id(),
                        {Bind(image_ids)}, record_set);
  }

  absl::Status SelectImageByReference(absl::string_view reference,
                                      RecordSet* record_set) final {
    return ExecuteQuery(query_config_.select_image_by_reference(),
                        {Bind(reference)}, record_set);
  }

  absl::Status DeleteImagesById(absl::Span<const int64_t> image_ids) final;

  absl::Status CheckManifestTable() final {
    return ExecuteQuery(query_config_.check_manifest_table());
  }

  absl::Status InsertManifest(int64_t image_id, int64_t schema_version,
                              absl::string_view media_type,
                              std::optional<absl::string_view> annotations_json,
                              int64_t* manifest_id) final {
    return ExecuteQuerySelectLastInsertID(
        query_config_.insert_manifest(),
        {Bind(image_id), Bind(schema_version), Bind(media_type),
         Bind(annotations_json)},
        manifest_id);
  }

  absl::Status SelectManifestsByID(absl::Span<const int64_t> manifest_ids,
                                   RecordSet* record_set) final {
    return ExecuteQuery(query_config_.select_manifests_by_id(),
                        {Bind(manifest_ids)}, record_set);
  }

  absl::Status SelectManifestsByImageID(int64_t image_id,
                                        RecordSet* record_set) final {
    return ExecuteQuery(query_config_.select_manifests_by_image_id(),
                        {Bind(image_id)}, record_set);
  }

 private:
  // Utility method to bind a string value. The value is escaped and quoted.
  std::string Bind(absl::string_view value);

  // Utility method to bind an optional string value. A missing value is bound
  // to NULL.
  std::string Bind(std::optional<absl::string_view> value);

  std::string Bind(int64_t value);

  // Utility method to bind an int64 vector to a string joined with "," that
  // can fit into SQL IN(...) clause.
  std::string Bind(absl::Span<const int64_t> value);

  // Execute a template query. All strings in parameters should already be
  // in a format appropriate for the SQL variant being used (at this point,
  // they are just inserted).
  // Results consist of zero or more rows represented in RecordSet.
  // Returns FAILED_PRECONDITION error, if Connection() is not opened.
  // Returns FAILED_PRECONDITION error, if a transaction has not begun.
  // Returns detailed INTERNAL error, if query execution fails.
  absl::Status ExecuteQuery(
      const MetadataSourceQueryConfig::TemplateQuery& template_query,
      absl::Span<const std::string> parameters, RecordSet* record_set);

  // Execute a template query and ignore the result.
  absl::Status ExecuteQuery(
      const MetadataSourceQueryConfig::TemplateQuery& template_query,
      absl::Span<const std::string> parameters) {
    RecordSet record_set;
    return ExecuteQuery(template_query, parameters, &record_set);
  }

  // Execute a template query without arguments and ignore the result.
  absl::Status ExecuteQuery(
      const MetadataSourceQueryConfig::TemplateQuery& query) {
    return ExecuteQuery(query, {});
  }

  // Execute a template query and returns the id of the inserted row.
  // Returns INTERNAL error, if it cannot find the last insert ID.
  absl::Status ExecuteQuerySelectLastInsertID(
      const MetadataSourceQueryConfig::TemplateQuery& query,
      absl::Span<const std::string> arguments, int64_t* last_insert_id) {
    OCIMD_RETURN_IF_ERROR(ExecuteQuery(query, arguments));
    return SelectLastInsertID(last_insert_id);
  }

  // Execute a plain query and ignore the result.
  absl::Status ExecuteQuery(const std::string& query);

  // Gets the last inserted id.
  absl::Status SelectLastInsertID(int64_t* last_insert_id);

  // Runs the schema change and then the queries of one migration direction.
  absl::Status ExecuteMigration(
      const SchemaChange& schema_change,
      const google::protobuf::RepeatedPtrField<
          MetadataSourceQueryConfig::TemplateQuery>& queries);

  MetadataSourceQueryConfig query_config_;

  // This object does not own the MetadataSource.
  MetadataSource* metadata_source_;
};

}  // namespace oci_metadata

#endif  // OCI_METADATA_METADATA_STORE_QUERY_CONFIG_EXECUTOR_H_
