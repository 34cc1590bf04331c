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
#include "oci_metadata/query/schema_change_query_builder.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "oci_metadata/metadata_store/constants.h"
#include "oci_metadata/util/return_utils.h"

namespace oci_metadata {

namespace {

// Table, column and index names are emitted between backticks without
// escaping, so only plain identifiers are accepted.
bool IsIdentifier(absl::string_view name) {
  if (name.empty()) return false;
  if (!absl::ascii_isalpha(name[0]) && name[0] != '_') return false;
  for (const char c : name) {
    if (!absl::ascii_isalnum(c) && c != '_') return false;
  }
  return true;
}

std::string Quote(absl::string_view name) {
  return absl::StrCat("`", name, "`");
}

std::string QuotedList(const std::vector<std::string>& names) {
  return absl::StrJoin(names, ", ", [](std::string* out, const std::string& n) {
    absl::StrAppend(out, Quote(n));
  });
}

absl::string_view OnDeleteClause(OnDeleteAction action) {
  switch (action) {
    case CASCADE:
      return " ON DELETE CASCADE";
    case SET_NULL:
      return " ON DELETE SET NULL";
    case RESTRICT:
      return " ON DELETE RESTRICT";
    default:
      return "";
  }
}

std::string GetColumnDefinition(const ColumnDefinition& column,
                                bool inline_primary_key) {
  std::string result = absl::StrCat(Quote(column.name()), " ",
                                    column.sql_type());
  if (column.primary_key() && inline_primary_key) {
    absl::StrAppend(&result, " PRIMARY KEY");
  }
  if (column.not_null()) absl::StrAppend(&result, " NOT NULL");
  if (column.has_default_value()) {
    absl::StrAppend(&result, " DEFAULT ", column.default_value());
  }
  return result;
}

}  // namespace

std::string SchemaChangeQueryBuilder::GetShadowTableName(
    absl::string_view table_name) {
  return absl::StrCat(table_name, kShadowTableSuffix);
}

absl::Status SchemaChangeQueryBuilder::ValidateTableDefinition(
    const TableDefinition& table) {
  if (!IsIdentifier(table.name())) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid table name: '", table.name(), "'"));
  }
  if (table.columns().empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Table ", table.name(), " has no columns."));
  }
  absl::flat_hash_set<std::string> columns;
  for (const ColumnDefinition& column : table.columns()) {
    if (!IsIdentifier(column.name())) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Invalid column name '", column.name(), "' in ", table.name()));
    }
    if (column.sql_type().empty()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Column ", table.name(), ".", column.name(), " has no sql_type."));
    }
    if (!columns.insert(column.name()).second) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Duplicate column ", column.name(), " in ", table.name()));
    }
  }
  for (const ForeignKeyDefinition& foreign_key : table.foreign_keys()) {
    if (!columns.contains(foreign_key.column())) {
      return absl::InvalidArgumentError(
          absl::StrCat("Foreign key of ", table.name(),
                       " names an undeclared column: ", foreign_key.column()));
    }
    if (!IsIdentifier(foreign_key.referenced_table()) ||
        !IsIdentifier(foreign_key.referenced_column())) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Foreign key ", table.name(), ".", foreign_key.column(),
          " has an invalid reference: ", foreign_key.referenced_table(), "(",
          foreign_key.referenced_column(), ")"));
    }
  }
  for (const IndexDefinition& index : table.indices()) {
    if (!IsIdentifier(index.name())) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Invalid index name '", index.name(), "' on ", table.name()));
    }
    if (index.columns().empty()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Index ", index.name(), " has no columns."));
    }
    for (const std::string& column : index.columns()) {
      if (!columns.contains(column)) {
        return absl::InvalidArgumentError(
            absl::StrCat("Index ", index.name(),
                         " names an undeclared column: ", column));
      }
    }
  }
  return absl::OkStatus();
}

absl::Status SchemaChangeQueryBuilder::Validate() const {
  absl::flat_hash_set<std::string> retired;
  for (const std::string& table : schema_change_.retired_tables()) {
    if (!IsIdentifier(table)) {
      return absl::InvalidArgumentError(
          absl::StrCat("Invalid retired table name: '", table, "'"));
    }
    retired.insert(table);
  }
  auto check_table =
      [&retired](const TableDefinition& table) -> absl::Status {
        OCIMD_RETURN_IF_ERROR(ValidateTableDefinition(table));
        if (retired.contains(table.name())) {
          return absl::InvalidArgumentError(absl::StrCat(
              "Table ", table.name(), " cannot be both kept and retired."));
        }
        // A retired table is dropped after every rebuild; nothing that survives
        // may still point at it.
        for (const ForeignKeyDefinition& foreign_key : table.foreign_keys()) {
          if (retired.contains(foreign_key.referenced_table())) {
            return absl::InvalidArgumentError(absl::StrCat(
                "Table ", table.name(), " references retired table ",
                foreign_key.referenced_table(), " through column ",
                foreign_key.column()));
          }
        }
        return absl::OkStatus();
      };
  for (const TableDefinition& table : schema_change_.created_tables()) {
    OCIMD_RETURN_IF_ERROR(check_table(table));
  }
  for (const TableDefinition& table : schema_change_.rebuilt_tables()) {
    OCIMD_RETURN_IF_ERROR(check_table(table));
    if (GetCopiedColumns(table).empty()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Rebuilt table ", table.name(), " has no column to copy."));
    }
  }
  return absl::OkStatus();
}

std::string SchemaChangeQueryBuilder::GetCreateTableQuery(
    const TableDefinition& table, absl::string_view table_name) {
  std::vector<std::string> primary_key;
  for (const ColumnDefinition& column : table.columns()) {
    if (column.primary_key()) primary_key.push_back(column.name());
  }
  // A single key column is declared inline so an INTEGER key stays the rowid.
  const bool inline_primary_key = primary_key.size() == 1;
  std::vector<std::string> definitions;
  for (const ColumnDefinition& column : table.columns()) {
    definitions.push_back(GetColumnDefinition(column, inline_primary_key));
  }
  if (primary_key.size() > 1) {
    definitions.push_back(
        absl::StrCat("PRIMARY KEY (", QuotedList(primary_key), ")"));
  }
  for (const ForeignKeyDefinition& foreign_key : table.foreign_keys()) {
    definitions.push_back(absl::StrCat(
        "FOREIGN KEY (", Quote(foreign_key.column()), ") REFERENCES ",
        Quote(foreign_key.referenced_table()), "(",
        Quote(foreign_key.referenced_column()), ")",
        OnDeleteClause(foreign_key.on_delete())));
  }
  return absl::StrCat("CREATE TABLE IF NOT EXISTS ", Quote(table_name), " ( ",
                      absl::StrJoin(definitions, ", "), " );");
}

std::vector<std::string> SchemaChangeQueryBuilder::GetCreateIndexQueries(
    const TableDefinition& table) {
  std::vector<std::string> queries;
  for (const IndexDefinition& index : table.indices()) {
    queries.push_back(absl::StrCat(
        "CREATE ", index.unique() ? "UNIQUE " : "", "INDEX IF NOT EXISTS ",
        Quote(index.name()), " ON ", Quote(table.name()), "(",
        QuotedList(std::vector<std::string>(index.columns().begin(),
                                            index.columns().end())),
        ");"));
  }
  return queries;
}

std::vector<std::string> SchemaChangeQueryBuilder::GetCopiedColumns(
    const TableDefinition& table) {
  std::vector<std::string> columns;
  for (const ColumnDefinition& column : table.columns()) {
    if (!column.is_new()) columns.push_back(column.name());
  }
  return columns;
}

std::vector<std::string> SchemaChangeQueryBuilder::GetRebuildTableQueries(
    const TableDefinition& table) {
  const std::string shadow_table = GetShadowTableName(table.name());
  const std::string copied_columns = QuotedList(GetCopiedColumns(table));
  std::vector<std::string> queries = {
      GetCreateTableQuery(table, shadow_table),
      absl::StrCat("INSERT INTO ", Quote(shadow_table), " (", copied_columns,
                   ") SELECT ", copied_columns, " FROM ", Quote(table.name()),
                   ";"),
      absl::StrCat("DROP TABLE ", Quote(table.name()), ";"),
      absl::StrCat("ALTER TABLE ", Quote(shadow_table), " RENAME TO ",
                   Quote(table.name()), ";")};
  for (std::string& query : GetCreateIndexQueries(table)) {
    queries.push_back(std::move(query));
  }
  return queries;
}

absl::StatusOr<std::vector<std::string>> SchemaChangeQueryBuilder::Build()
    const {
  OCIMD_RETURN_IF_ERROR(Validate());
  std::vector<std::string> queries;
  for (const TableDefinition& table : schema_change_.created_tables()) {
    queries.push_back(GetCreateTableQuery(table, table.name()));
    for (std::string& query : GetCreateIndexQueries(table)) {
      queries.push_back(std::move(query));
    }
  }
  for (const TableDefinition& table : schema_change_.rebuilt_tables()) {
    for (std::string& query : GetRebuildTableQueries(table)) {
      queries.push_back(std::move(query));
    }
  }
  for (const std::string& table : schema_change_.retired_tables()) {
    queries.push_back(absl::StrCat("DROP TABLE IF EXISTS ", Quote(table), ";"));
  }
  return queries;
}

}  // namespace oci_metadata
