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
#include "oci_metadata/metadata_store/query_config_executor.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <glog/logging.h>
#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/string_view.h"
#include "oci_metadata/metadata_store/constants.h"
#include "oci_metadata/proto/metadata_source.pb.h"
#include "oci_metadata/query/schema_change_query_builder.h"
#include "oci_metadata/util/return_utils.h"

namespace oci_metadata {

absl::Status QueryConfigExecutor::GetSchemaVersion(int64_t* db_version) {
  RecordSet record_set;
  const absl::Status maybe_schema_version_status =
      ExecuteQuery(query_config_.check_env_table(), {}, &record_set);
  if (!maybe_schema_version_status.ok()) {
    if (!absl::StrContains(maybe_schema_version_status.message(),
                           "no such table")) {
      return maybe_schema_version_status;
    }
    return absl::NotFoundError(
        absl::StrCat("it looks an empty db is given: ",
                     maybe_schema_version_status.message()));
  }
  if (record_set.records_size() == 0) {
    return absl::AbortedError(
        "In the given db, OciEnv table exists but no schema_version can be "
        "found. This may be due to concurrent connection to the empty "
        "database. Please retry connection.");
  } else if (record_set.records_size() > 1) {
    return absl::DataLossError(absl::StrCat(
        "In the given db, OciEnv table exists but schema_version cannot be "
        "resolved due to there being more than one rows with the schema "
        "version. Expecting a single row: ",
        record_set.DebugString()));
  }
  if (!absl::SimpleAtoi(record_set.records(0).values(0), db_version)) {
    return absl::DataLossError(
        absl::StrCat("Cannot parse the schema_version: ",
                     record_set.records(0).values(0)));
  }
  return absl::OkStatus();
}

absl::Status QueryConfigExecutor::ApplySchemaChange(
    const SchemaChange& schema_change) {
  OCIMD_ASSIGN_OR_RETURN(std::vector<std::string> queries,
                         SchemaChangeQueryBuilder(schema_change).Build());
  for (const std::string& query : queries) {
    VLOG(1) << "Schema change: " << query;
    OCIMD_RETURN_WITH_CONTEXT_IF_ERROR(
        ExecuteQuery(query), "Schema change query failed: ", query, ": ");
  }
  return absl::OkStatus();
}

absl::Status QueryConfigExecutor::ExecuteMigration(
    const SchemaChange& schema_change,
    const google::protobuf::RepeatedPtrField<
        MetadataSourceQueryConfig::TemplateQuery>& queries) {
  OCIMD_RETURN_IF_ERROR(ApplySchemaChange(schema_change));
  for (const MetadataSourceQueryConfig::TemplateQuery& query : queries) {
    VLOG(1) << "Migration query: " << query.query();
    OCIMD_RETURN_WITH_CONTEXT_IF_ERROR(
        ExecuteQuery(query), "Migration query failed: ", query.query(), ": ");
  }
  return absl::OkStatus();
}

absl::Status QueryConfigExecutor::UpgradeMetadataSourceIfOutOfDate(
    bool enable_migration) {
  int64_t db_version = 0;
  const absl::Status get_schema_version_status = GetSchemaVersion(&db_version);
  const int64_t lib_version = GetLibraryVersion();
  if (absl::IsNotFound(get_schema_version_status)) {
    db_version = lib_version;
  } else {
    OCIMD_RETURN_IF_ERROR(get_schema_version_status);
  }
  if (db_version == lib_version) {
    return absl::OkStatus();
  }
  if (db_version > lib_version) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Database version ", db_version, " is greater than library version ",
        lib_version,
        ". Please upgrade the library to use the given database in order to "
        "prevent potential data loss. If data loss is acceptable, please"
        " downgrade the database using a newer version of library."));
  }
  // returns error if upgrade is explicitly disabled, as we are missing schema
  // and cannot continue with this library version.
  if (!enable_migration) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Database version ", db_version, " is older than library version ",
        lib_version,
        ". Schema migration is disabled. Please upgrade the database then use"
        " the library version; or switch to a older library version to use the"
        " current database."));
  }

  // migrate db_version to lib version
  const auto& migration_schemes = query_config_.migration_schemes();
  while (db_version < lib_version) {
    const int64_t to_version = db_version + 1;
    if (migration_schemes.find(to_version) == migration_schemes.end()) {
      return absl::InternalError(absl::StrCat(
          "Cannot find migration_schemes to version ", to_version));
    }
    const MetadataSourceQueryConfig::MigrationScheme& scheme =
        migration_schemes.at(to_version);
    LOG(INFO) << "Upgrading database schema from version " << db_version
              << " to " << to_version;
    OCIMD_RETURN_WITH_CONTEXT_IF_ERROR(
        ExecuteMigration(scheme.upgrade_schema_change(),
                         scheme.upgrade_queries()),
        "Failed to migrate existing db; the migration transaction rolls "
        "back. ");
    OCIMD_RETURN_WITH_CONTEXT_IF_ERROR(UpdateSchemaVersion(to_version),
                                       "Failed to update schema. ");
    db_version = to_version;
  }
  return absl::OkStatus();
}

absl::Status QueryConfigExecutor::DowngradeMetadataSource(
    const int64_t to_schema_version) {
  const int64_t lib_version = GetLibraryVersion();
  if (to_schema_version < kMinimumSchemaVersion ||
      to_schema_version > lib_version) {
    return absl::InvalidArgumentError(absl::StrCat(
        "The database cannot be downgraded to schema_version: ",
        to_schema_version,
        ". The target version should be greater or equal to ",
        kMinimumSchemaVersion, ", and the current library version: ",
        lib_version, " needs to be greater than the target version."));
  }
  int64_t db_version = 0;
  const absl::Status get_schema_version_status = GetSchemaVersion(&db_version);
  // if it is an empty database, then we skip downgrade and returns.
  if (absl::IsNotFound(get_schema_version_status)) {
    return absl::InvalidArgumentError(
        "Empty database is given. Downgrade operation is not needed.");
  }
  OCIMD_RETURN_IF_ERROR(get_schema_version_status);
  if (db_version > lib_version) {
    return absl::FailedPreconditionError(
        absl::StrCat("Database version ", db_version,
                     " is greater than library version ", lib_version,
                     ". The current library does not know how to downgrade it. "
                     "Please upgrade the library to downgrade the schema."));
  }
  // perform downgrade
  const auto& migration_schemes = query_config_.migration_schemes();
  while (db_version > to_schema_version) {
    const int64_t to_version = db_version - 1;
    if (migration_schemes.find(to_version) == migration_schemes.end()) {
      return absl::InternalError(absl::StrCat(
          "Cannot find migration_schemes to version ", to_version));
    }
    const MetadataSourceQueryConfig::MigrationScheme& scheme =
        migration_schemes.at(to_version);
    LOG(INFO) << "Downgrading database schema from version " << db_version
              << " to " << to_version;
    OCIMD_RETURN_WITH_CONTEXT_IF_ERROR(
        ExecuteMigration(scheme.downgrade_schema_change(),
                         scheme.downgrade_queries()),
        "Failed to migrate existing db; the migration transaction rolls "
        "back. ");
    OCIMD_RETURN_WITH_CONTEXT_IF_ERROR(
        UpdateSchemaVersion(to_version),
        "Failed to migrate existing db; the migration transaction rolls "
        "back. ");
    db_version = to_version;
  }
  return absl::OkStatus();
}

absl::Status QueryConfigExecutor::InitMetadataSource() {
  OCIMD_RETURN_IF_ERROR(DeleteMetadataSource());
  OCIMD_RETURN_IF_ERROR(ExecuteQuery(query_config_.create_image_table()));
  OCIMD_RETURN_IF_ERROR(ExecuteQuery(query_config_.create_manifest_table()));
  OCIMD_RETURN_IF_ERROR(ExecuteQuery(query_config_.create_env_table()));
  for (const MetadataSourceQueryConfig::TemplateQuery& index_query :
       query_config_.secondary_indices()) {
    OCIMD_RETURN_IF_ERROR(ExecuteQuery(index_query));
  }

  return InsertSchemaVersion(GetLibraryVersion());
}

absl::Status QueryConfigExecutor::InitMetadataSourceIfNotExists(
    const bool enable_upgrade_migration) {
  // check db version, and make it to align with the lib version.
  OCIMD_RETURN_IF_ERROR(
      UpgradeMetadataSourceIfOutOfDate(enable_upgrade_migration));
  // if lib and db versions align, we check the required tables for the lib.
  std::vector<std::pair<absl::Status, std::string>> checks;
  checks.push_back({CheckImageTable(), "image_table"});
  checks.push_back({CheckManifestTable(), "manifest_table"});
  checks.push_back({CheckEnvTable(), "env_table"});
  std::vector<std::string> missing_schema_error_messages;
  std::vector<std::string> successful_checks;
  std::vector<std::string> failing_checks;
  for (const auto& check_pair : checks) {
    const absl::Status& check = check_pair.first;
    const std::string& name = check_pair.second;
    if (!check.ok()) {
      missing_schema_error_messages.push_back(check.ToString());
      failing_checks.push_back(name);
    } else {
      successful_checks.push_back(name);
    }
  }

  // all table required by the current lib version exists
  if (missing_schema_error_messages.empty()) return absl::OkStatus();

  // some table exists, but not all.
  if (checks.size() != missing_schema_error_messages.size()) {
    return absl::AbortedError(absl::StrCat(
        "There are a subset of tables in the database. This may be due to "
        "concurrent connection to the empty database. "
        "Please retry the connection. checks: ",
        checks.size(), " errors: ", missing_schema_error_messages.size(),
        ", present tables: ", absl::StrJoin(successful_checks, ", "),
        ", missing tables: ", absl::StrJoin(failing_checks, ", "),
        " Errors: ", absl::StrJoin(missing_schema_error_messages, "\n")));
  }

  // no table exists, then init the MetadataSource
  LOG(INFO) << "Creating schema version " << GetLibraryVersion();
  return InitMetadataSource();
}

absl::Status QueryConfigExecutor::DeleteMetadataSource() {
  // manifests reference images, so they go first. A database of an older
  // version may still have retired tables referencing images.
  OCIMD_RETURN_IF_ERROR(ExecuteQuery(query_config_.drop_manifest_table()));
  for (const MetadataSourceQueryConfig::TemplateQuery& drop_query :
       query_config_.drop_retired_tables()) {
    OCIMD_RETURN_IF_ERROR(ExecuteQuery(drop_query));
  }
  OCIMD_RETURN_IF_ERROR(ExecuteQuery(query_config_.drop_image_table()));
  return ExecuteQuery(query_config_.drop_env_table());
}

absl::Status QueryConfigExecutor::DeleteImagesById(
    absl::Span<const int64_t> image_ids) {
  if (image_ids.empty()) {
    return absl::OkStatus();
  }
  return ExecuteQuery(query_config_.delete_images_by_id(), {Bind(image_ids)});
}

absl::Status QueryConfigExecutor::SelectLastInsertID(int64_t* last_insert_id) {
  RecordSet record_set;
  OCIMD_RETURN_IF_ERROR(
      ExecuteQuery(query_config_.select_last_insert_id(), {}, &record_set));
  if (record_set.records_size() == 0) {
    return absl::InternalError("Could not find last insert ID: no record");
  }
  const RecordSet::Record& record = record_set.records(0);
  if (record.values_size() == 0) {
    return absl::InternalError("Could not find last insert ID: missing value");
  }
  if (!absl::SimpleAtoi(record.values(0), last_insert_id)) {
    return absl::InternalError("Could not parse last insert ID as string");
  }
  return absl::OkStatus();
}

std::string QueryConfigExecutor::Bind(absl::string_view value) {
  return absl::StrCat("'", metadata_source_->EscapeString(value), "'");
}

std::string QueryConfigExecutor::Bind(std::optional<absl::string_view> value) {
  return value ? Bind(*value) : "NULL";
}

std::string QueryConfigExecutor::Bind(int64_t value) {
  return std::to_string(value);
}

std::string QueryConfigExecutor::Bind(absl::Span<const int64_t> value) {
  return absl::StrJoin(value, ", ");
}

absl::Status QueryConfigExecutor::ExecuteQuery(const std::string& query) {
  RecordSet record_set;
  return metadata_source_->ExecuteQuery(query, &record_set);
}

absl::Status QueryConfigExecutor::ExecuteQuery(
    const MetadataSourceQueryConfig::TemplateQuery& template_query,
    absl::Span<const std::string> parameters, RecordSet* record_set) {
  if (parameters.size() > 10) {
    return absl::InvalidArgumentError(
        "Template query has too many parameters (at most 10 is supported).");
  }
  if (template_query.parameter_num() != parameters.size()) {
    LOG(FATAL) << "Template query parameter_num ("
               << template_query.parameter_num()
               << ") does not match with given "
               << "parameters size (" << parameters.size()
               << "): " << template_query.DebugString();
  }
  std::vector<std::pair<const std::string, const std::string>> replacements;
  replacements.reserve(parameters.size());
  for (int i = 0; i < parameters.size(); i++) {
    replacements.push_back({absl::StrCat("$", i), parameters[i]});
  }
  return metadata_source_->ExecuteQuery(
      absl::StrReplaceAll(template_query.query(), replacements), record_set);
}

}  // namespace oci_metadata
