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
#ifndef OCI_METADATA_QUERY_SCHEMA_CHANGE_QUERY_BUILDER_H_
#define OCI_METADATA_QUERY_SCHEMA_CHANGE_QUERY_BUILDER_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "oci_metadata/proto/metadata_source.pb.h"

namespace oci_metadata {

// SchemaChangeQueryBuilder compiles a declarative SchemaChange into the SQL
// statements that apply it, in dependency order:
//
//   1. every created table: CREATE TABLE IF NOT EXISTS, then its indices.
//   2. every rebuilt table, through a shadow table `<name>_new`:
//        CREATE TABLE IF NOT EXISTS `<name>_new` (<target shape>);
//        INSERT INTO `<name>_new` (<copied>) SELECT <copied> FROM `<name>`;
//        DROP TABLE `<name>`;
//        ALTER TABLE `<name>_new` RENAME TO `<name>`;
//        CREATE INDEX IF NOT EXISTS ... for every index of the target.
//   3. every retired table: DROP TABLE IF EXISTS.
//
// The copied columns are the target columns not marked `is_new`, named on
// both sides of the copy. Columns of the old table missing from the target
// are dropped. The statements carry no transaction control; the caller runs
// them inside one transaction.
//
// Usage example:
//
//   SchemaChange change;
//   ...
//   OCIMD_ASSIGN_OR_RETURN(std::vector<std::string> queries,
//                          SchemaChangeQueryBuilder(change).Build());
//   for (const std::string& query : queries) {
//     OCIMD_RETURN_IF_ERROR(metadata_source->ExecuteQuery(query, nullptr));
//   }
class SchemaChangeQueryBuilder {
 public:
  explicit SchemaChangeQueryBuilder(const SchemaChange& schema_change)
      : schema_change_(schema_change) {}

  // Not copyable or movable
  SchemaChangeQueryBuilder(const SchemaChangeQueryBuilder&) = delete;
  SchemaChangeQueryBuilder& operator=(const SchemaChangeQueryBuilder&) = delete;

  // Returns INVALID_ARGUMENT if the schema change is malformed, see
  // Validate().
  absl::StatusOr<std::vector<std::string>> Build() const;

  // Checks every table definition, and that no created or rebuilt table is
  // also retired or still references a retired table.
  absl::Status Validate() const;

  // Returns OK if `table` is well formed: a valid name, at least one column,
  // unique typed column names, foreign keys and indices over declared
  // columns, and named indices with at least one column.
  static absl::Status ValidateTableDefinition(const TableDefinition& table);

  // Returns the CREATE TABLE IF NOT EXISTS statement of `table` under the
  // given name.
  static std::string GetCreateTableQuery(const TableDefinition& table,
                                         absl::string_view table_name);

  // Returns the CREATE [UNIQUE] INDEX IF NOT EXISTS statements of `table`.
  static std::vector<std::string> GetCreateIndexQueries(
      const TableDefinition& table);

  // Returns the columns copied from the old table into the shadow table.
  static std::vector<std::string> GetCopiedColumns(
      const TableDefinition& table);

  // Returns the statements rebuilding `table` through its shadow table.
  static std::vector<std::string> GetRebuildTableQueries(
      const TableDefinition& table);

  // Returns the shadow table name of `table_name`.
  static std::string GetShadowTableName(absl::string_view table_name);

 private:
  const SchemaChange& schema_change_;
};

}  // namespace oci_metadata

#endif  // OCI_METADATA_QUERY_SCHEMA_CHANGE_QUERY_BUILDER_H_
