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
#include "oci_metadata/metadata_store/metadata_store_factory.h"

#include <memory>
#include <string>
#include <utility>

#include <glog/logging.h>
#include "absl/status/status.h"
#include "oci_metadata/metadata_store/metadata_store.h"
#include "oci_metadata/metadata_store/sqlite_metadata_source.h"
#include "oci_metadata/metadata_store/transaction_executor.h"
#include "oci_metadata/util/metadata_source_query_config.h"
#include "oci_metadata/util/return_utils.h"

namespace oci_metadata {
namespace {

// Opens the SQLite database of `config` and brings its schema to the library
// version, as far as `migration_options` allow. On any error `result` is left
// untouched.
absl::Status CreateSqliteMetadataStore(
    const SqliteMetadataSourceConfig& config,
    const MigrationOptions& migration_options,
    std::unique_ptr<MetadataStore>* result) {
  const std::string database = config.has_filename_uri()
                                   ? config.filename_uri()
                                   : std::string("in-memory database");
  auto metadata_source = std::make_unique<SqliteMetadataSource>(config);
  auto transaction_executor =
      std::make_unique<RdbmsTransactionExecutor>(metadata_source.get());
  std::unique_ptr<MetadataStore> store;
  OCIMD_RETURN_IF_ERROR(MetadataStore::Create(
      util::GetSqliteMetadataSourceQueryConfig(), migration_options,
      std::move(metadata_source), std::move(transaction_executor), &store));
  OCIMD_RETURN_WITH_CONTEXT_IF_ERROR(
      store->InitMetadataStoreIfNotExists(
          migration_options.enable_upgrade_migration()),
      "Cannot prepare the schema of ", database, ": ");
  VLOG(1) << "Opened metadata store on " << database;
  *result = std::move(store);
  return absl::OkStatus();
}

}  // namespace

absl::Status CreateMetadataStore(const ConnectionConfig& config,
                                 const MigrationOptions& options,
                                 std::unique_ptr<MetadataStore>* result) {
  switch (config.config_case()) {
    case ConnectionConfig::CONFIG_NOT_SET:
      return absl::InvalidArgumentError(
          "A metadata store type must be specified.");
    case ConnectionConfig::kFakeDatabase:
      // Creates an in-memory SQLite database for testing.
      return CreateSqliteMetadataStore(SqliteMetadataSourceConfig(), options,
                                       result);
    case ConnectionConfig::kSqlite:
      return CreateSqliteMetadataStore(config.sqlite(), options, result);
    default:
      return absl::UnimplementedError("Unknown database type.");
  }
}

absl::Status CreateMetadataStore(const ConnectionConfig& config,
                                 std::unique_ptr<MetadataStore>* result) {
  return CreateMetadataStore(config, {}, result);
}

}  // namespace oci_metadata
