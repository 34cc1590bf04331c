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
#ifndef OCI_METADATA_METADATA_STORE_SQLITE_METADATA_SOURCE_H_
#define OCI_METADATA_METADATA_STORE_SQLITE_METADATA_SOURCE_H_

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "oci_metadata/metadata_store/metadata_source.h"
#include "oci_metadata/proto/metadata_source.pb.h"
#include "sqlite3.h"

namespace oci_metadata {

// A MetadataSource over a sqlite3 database. If the config has no filename, an
// in-memory database is used and destroyed when the connection is closed.
// Foreign-key enforcement is switched on for every connection.
class SqliteMetadataSource : public MetadataSource {
 public:
  explicit SqliteMetadataSource(const SqliteMetadataSourceConfig& config);
  ~SqliteMetadataSource() override;

  // Disallow copy and assign.
  SqliteMetadataSource(const SqliteMetadataSource&) = delete;
  SqliteMetadataSource& operator=(const SqliteMetadataSource&) = delete;

  // Escape strings having single quotes using built-in printf in Sqlite3 C API.
  std::string EscapeString(absl::string_view value) const final;

 private:
  // Opens the database and enables foreign keys.
  // If error happens, Returns INTERNAL error.
  absl::Status ConnectImpl() final;

  // Closes the db. An in-memory db is cleaned up.
  absl::Status CloseImpl() final;

  // Executes a SQL statement and returns the rows if any.
  absl::Status ExecuteQueryImpl(const std::string& query,
                                RecordSet* results) final;

  absl::Status CommitImpl() final;

  absl::Status RollbackImpl() final;

  absl::Status BeginImpl() final;

  // Util methods to execute query.
  absl::Status RunStatement(const std::string& query, RecordSet* results);

  // The sqlite3 handle to a database.
  sqlite3* db_ = nullptr;

  // A config including connection parameters.
  SqliteMetadataSourceConfig config_;
};

}  // namespace oci_metadata

#endif  // OCI_METADATA_METADATA_STORE_SQLITE_METADATA_SOURCE_H_
