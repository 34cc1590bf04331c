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
#include <iostream>
#include <memory>
#include <string>

#include "gflags/gflags.h"
#include <glog/logging.h>
#include "absl/status/status.h"
#include "oci_metadata/metadata_store/metadata_store.h"
#include "oci_metadata/metadata_store/metadata_store_factory.h"
#include "oci_metadata/proto/metadata_store.pb.h"
#include "oci_metadata/proto/metadata_store_service.pb.h"

DEFINE_string(db_path, "",
              "Path of the SQLite database file holding the image metadata. "
              "The file is created if it does not exist.");
DEFINE_bool(
    enable_upgrade_migration, false,
    "Flag specifying database upgrade option. If set to true, an older "
    "database is migrated to the library schema version in one transaction.");
DEFINE_int64(downgrade_to_schema_version, -1,
             "Database downgrade schema version value. If set the database "
             "schema version is downgraded to the set value (Optional "
             "Parameter)");
DEFINE_bool(print_schema_version, false,
            "Prints the schema version of the database after opening it.");
DEFINE_int32(
    metadata_store_connection_retries, 3,
    "The max number of retries when connecting to the database is aborted.");

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  if (FLAGS_db_path.empty()) {
    LOG(ERROR) << "--db_path must not be empty";
    return 1;
  }

  oci_metadata::ConnectionConfig connection_config;
  connection_config.mutable_sqlite()->set_filename_uri(FLAGS_db_path);
  oci_metadata::MigrationOptions migration_options;
  migration_options.set_enable_upgrade_migration(
      FLAGS_enable_upgrade_migration);
  migration_options.set_downgrade_to_schema_version(
      FLAGS_downgrade_to_schema_version);

  std::unique_ptr<oci_metadata::MetadataStore> metadata_store;
  absl::Status status = oci_metadata::CreateMetadataStore(
      connection_config, migration_options, &metadata_store);
  for (int i = 0; i < FLAGS_metadata_store_connection_retries; i++) {
    if (status.ok() || !absl::IsAborted(status)) {
      break;
    }
    LOG(WARNING) << "Connection Aborted with error: " << status;
    LOG(INFO) << "Retry attempt " << i;
    status = oci_metadata::CreateMetadataStore(
        connection_config, migration_options, &metadata_store);
  }

  // A performed downgrade closes the connection on purpose.
  if (FLAGS_downgrade_to_schema_version >= 0 && absl::IsCancelled(status)) {
    LOG(INFO) << "Database " << FLAGS_db_path
              << " is downgraded to schema version "
              << FLAGS_downgrade_to_schema_version;
    return 0;
  }
  if (!status.ok()) {
    LOG(ERROR) << "MetadataStore cannot be created for " << FLAGS_db_path
               << ": " << status;
    return 1;
  }

  if (FLAGS_print_schema_version) {
    oci_metadata::GetSchemaVersionResponse response;
    status = metadata_store->GetSchemaVersion(
        oci_metadata::GetSchemaVersionRequest(), &response);
    if (!status.ok()) {
      LOG(ERROR) << "Cannot read the schema version: " << status;
      return 1;
    }
    std::cout << response.schema_version() << std::endl;
  }
  LOG(INFO) << "Database " << FLAGS_db_path << " is ready";
  return 0;
}
