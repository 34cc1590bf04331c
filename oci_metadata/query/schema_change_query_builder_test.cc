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
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "oci_metadata/metadata_store/test_util.h"
#include "oci_metadata/proto/metadata_source.pb.h"
#include "oci_metadata/util/metadata_source_query_config.h"

namespace oci_metadata {
namespace {

using ::oci_metadata::testing::ParseTextProtoOrDie;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

constexpr char kManifestsTable[] = R"pb(
  name: "manifests"
  columns { name: "id" sql_type: "INTEGER" primary_key: true }
  columns { name: "image_id" sql_type: "INTEGER" not_null: true }
  columns { name: "media_type" sql_type: "TEXT" not_null: true }
  columns {
    name: "created_at"
    sql_type: "DATETIME"
    default_value: "CURRENT_TIMESTAMP"
  }
  foreign_keys {
    column: "image_id"
    referenced_table: "images"
    referenced_column: "id"
    on_delete: CASCADE
  }
  indices { name: "idx_manifests_image_id" columns: "image_id" }
)pb";

TableDefinition ManifestsTable() {
  return ParseTextProtoOrDie<TableDefinition>(kManifestsTable);
}

std::string GetValidationError(const SchemaChange& schema_change) {
  const absl::StatusOr<std::vector<std::string>> queries =
      SchemaChangeQueryBuilder(schema_change).Build();
  EXPECT_TRUE(absl::IsInvalidArgument(queries.status()));
  return std::string(queries.status().message());
}

TEST(SchemaChangeQueryBuilderTest, CreateTableQuery) {
  EXPECT_EQ(
      SchemaChangeQueryBuilder::GetCreateTableQuery(ManifestsTable(),
                                                    "manifests_new"),
      "CREATE TABLE IF NOT EXISTS `manifests_new` ( "
      "`id` INTEGER PRIMARY KEY, `image_id` INTEGER NOT NULL, "
      "`media_type` TEXT NOT NULL, "
      "`created_at` DATETIME DEFAULT CURRENT_TIMESTAMP, "
      "FOREIGN KEY (`image_id`) REFERENCES `images`(`id`) ON DELETE CASCADE "
      ");");
}

TEST(SchemaChangeQueryBuilderTest, CreateTableQueryWithCompositeKey) {
  const TableDefinition table = ParseTextProtoOrDie<TableDefinition>(R"pb(
    name: "layers"
    columns { name: "manifest_id" sql_type: "INTEGER" primary_key: true }
    columns { name: "position" sql_type: "INTEGER" primary_key: true }
    foreign_keys {
      column: "manifest_id"
      referenced_table: "manifests"
      referenced_column: "id"
      on_delete: SET_NULL
    }
  )pb");
  EXPECT_EQ(SchemaChangeQueryBuilder::GetCreateTableQuery(table, "layers"),
            "CREATE TABLE IF NOT EXISTS `layers` ( "
            "`manifest_id` INTEGER, `position` INTEGER, "
            "PRIMARY KEY (`manifest_id`, `position`), "
            "FOREIGN KEY (`manifest_id`) REFERENCES `manifests`(`id`) "
            "ON DELETE SET NULL );");
}

TEST(SchemaChangeQueryBuilderTest, CreateIndexQueries) {
  TableDefinition table = ManifestsTable();
  IndexDefinition* unique_index = table.add_indices();
  unique_index->set_name("idx_manifests_image_media");
  unique_index->add_columns("image_id");
  unique_index->add_columns("media_type");
  unique_index->set_unique(true);
  EXPECT_THAT(
      SchemaChangeQueryBuilder::GetCreateIndexQueries(table),
      ElementsAre("CREATE INDEX IF NOT EXISTS `idx_manifests_image_id` "
                  "ON `manifests`(`image_id`);",
                  "CREATE UNIQUE INDEX IF NOT EXISTS "
                  "`idx_manifests_image_media` "
                  "ON `manifests`(`image_id`, `media_type`);"));
}

// The copy names its columns on both sides, so a dropped column never
// shifts the values of the columns after it.
TEST(SchemaChangeQueryBuilderTest, RebuildTableQueries) {
  EXPECT_THAT(
      SchemaChangeQueryBuilder::GetRebuildTableQueries(ManifestsTable()),
      ElementsAre(
          HasSubstr("CREATE TABLE IF NOT EXISTS `manifests_new` ( "),
          "INSERT INTO `manifests_new` (`id`, `image_id`, `media_type`, "
          "`created_at`) SELECT `id`, `image_id`, `media_type`, "
          "`created_at` FROM `manifests`;",
          "DROP TABLE `manifests`;",
          "ALTER TABLE `manifests_new` RENAME TO `manifests`;",
          "CREATE INDEX IF NOT EXISTS `idx_manifests_image_id` "
          "ON `manifests`(`image_id`);"));
}

TEST(SchemaChangeQueryBuilderTest, NewColumnsAreNotCopied) {
  TableDefinition table = ManifestsTable();
  ColumnDefinition* index_id = table.add_columns();
  index_id->set_name("index_id");
  index_id->set_sql_type("INTEGER");
  index_id->set_is_new(true);
  EXPECT_THAT(SchemaChangeQueryBuilder::GetCopiedColumns(table),
              ElementsAre("id", "image_id", "media_type", "created_at"));
  EXPECT_THAT(SchemaChangeQueryBuilder::GetCreateTableQuery(table, "m"),
              HasSubstr("`index_id` INTEGER, FOREIGN KEY"));
}

TEST(SchemaChangeQueryBuilderTest, BuildOrdersCreateRebuildRetire) {
  SchemaChange schema_change;
  *schema_change.add_rebuilt_tables() = ManifestsTable();
  TableDefinition* created = schema_change.add_created_tables();
  created->set_name("blobs");
  ColumnDefinition* digest = created->add_columns();
  digest->set_name("digest");
  digest->set_sql_type("TEXT");
  digest->set_primary_key(true);
  schema_change.add_retired_tables("indexes");

  const absl::StatusOr<std::vector<std::string>> queries =
      SchemaChangeQueryBuilder(schema_change).Build();
  ASSERT_EQ(absl::OkStatus(), queries.status());
  EXPECT_THAT(
      *queries,
      ElementsAre("CREATE TABLE IF NOT EXISTS `blobs` ( "
                  "`digest` TEXT PRIMARY KEY );",
                  HasSubstr("`manifests_new`"), HasSubstr("INSERT INTO"),
                  "DROP TABLE `manifests`;", HasSubstr("RENAME TO"),
                  HasSubstr("`idx_manifests_image_id`"),
                  "DROP TABLE IF EXISTS `indexes`;"));
}

TEST(SchemaChangeQueryBuilderTest, EmptySchemaChange) {
  const absl::StatusOr<std::vector<std::string>> queries =
      SchemaChangeQueryBuilder(SchemaChange()).Build();
  ASSERT_EQ(absl::OkStatus(), queries.status());
  EXPECT_THAT(*queries, IsEmpty());
}

// The step shipped with the library rebuilds manifests without index_id and
// then drops the indexes table.
TEST(SchemaChangeQueryBuilderTest, SqliteUpgradeToVersion2) {
  const MetadataSourceQueryConfig config =
      util::GetSqliteMetadataSourceQueryConfig();
  const absl::StatusOr<std::vector<std::string>> queries =
      SchemaChangeQueryBuilder(
          config.migration_schemes().at(2).upgrade_schema_change())
          .Build();
  ASSERT_EQ(absl::OkStatus(), queries.status());
  ASSERT_EQ(6, queries->size());
  for (const std::string& query : *queries) {
    EXPECT_THAT(query, ::testing::Not(HasSubstr("index_id")));
  }
  EXPECT_EQ((*queries)[1],
            "INSERT INTO `manifests_new` (`id`, `image_id`, `schema_version`, "
            "`media_type`, `annotations_json`, `created_at`, `modified_at`) "
            "SELECT `id`, `image_id`, `schema_version`, `media_type`, "
            "`annotations_json`, `created_at`, `modified_at` "
            "FROM `manifests`;");
  EXPECT_EQ((*queries)[4],
            "CREATE INDEX IF NOT EXISTS `idx_manifests_image_id` "
            "ON `manifests`(`image_id`);");
  EXPECT_EQ((*queries)[5], "DROP TABLE IF EXISTS `indexes`;");
}

TEST(SchemaChangeQueryBuilderTest, RejectTableBothKeptAndRetired) {
  SchemaChange schema_change;
  *schema_change.add_rebuilt_tables() = ManifestsTable();
  schema_change.add_retired_tables("manifests");
  EXPECT_THAT(GetValidationError(schema_change),
              HasSubstr("cannot be both kept and retired"));
}

TEST(SchemaChangeQueryBuilderTest, RejectReferenceToRetiredTable) {
  SchemaChange schema_change;
  *schema_change.add_rebuilt_tables() = ManifestsTable();
  schema_change.add_retired_tables("images");
  EXPECT_THAT(GetValidationError(schema_change),
              HasSubstr("references retired table images"));
}

TEST(SchemaChangeQueryBuilderTest, RejectRebuildWithNothingToCopy) {
  SchemaChange schema_change;
  TableDefinition* table = schema_change.add_rebuilt_tables();
  table->set_name("indexes");
  ColumnDefinition* column = table->add_columns();
  column->set_name("id");
  column->set_sql_type("INTEGER");
  column->set_is_new(true);
  EXPECT_THAT(GetValidationError(schema_change),
              HasSubstr("has no column to copy"));
}

TEST(SchemaChangeQueryBuilderTest, RejectMalformedNames) {
  {
    SchemaChange schema_change;
    schema_change.add_retired_tables("indexes; DROP TABLE images");
    EXPECT_THAT(GetValidationError(schema_change),
                HasSubstr("Invalid retired table name"));
  }
  {
    SchemaChange schema_change;
    TableDefinition* table = schema_change.add_created_tables();
    *table = ManifestsTable();
    table->mutable_columns(1)->set_name("image`id");
    EXPECT_THAT(GetValidationError(schema_change),
                HasSubstr("Invalid column name"));
  }
}

TEST(SchemaChangeQueryBuilderTest, ValidateTableDefinition) {
  EXPECT_EQ(absl::OkStatus(),
            SchemaChangeQueryBuilder::ValidateTableDefinition(
                ManifestsTable()));

  TableDefinition no_columns;
  no_columns.set_name("manifests");
  EXPECT_TRUE(absl::IsInvalidArgument(
      SchemaChangeQueryBuilder::ValidateTableDefinition(no_columns)));

  TableDefinition duplicate = ManifestsTable();
  *duplicate.add_columns() = duplicate.columns(0);
  EXPECT_TRUE(absl::IsInvalidArgument(
      SchemaChangeQueryBuilder::ValidateTableDefinition(duplicate)));

  TableDefinition untyped = ManifestsTable();
  untyped.mutable_columns(2)->clear_sql_type();
  EXPECT_TRUE(absl::IsInvalidArgument(
      SchemaChangeQueryBuilder::ValidateTableDefinition(untyped)));

  TableDefinition dangling_key = ManifestsTable();
  dangling_key.mutable_foreign_keys(0)->set_column("index_id");
  EXPECT_TRUE(absl::IsInvalidArgument(
      SchemaChangeQueryBuilder::ValidateTableDefinition(dangling_key)));

  TableDefinition dangling_index = ManifestsTable();
  dangling_index.mutable_indices(0)->set_columns(0, "index_id");
  EXPECT_TRUE(absl::IsInvalidArgument(
      SchemaChangeQueryBuilder::ValidateTableDefinition(dangling_index)));

  TableDefinition unnamed_index = ManifestsTable();
  unnamed_index.mutable_indices(0)->clear_name();
  EXPECT_TRUE(absl::IsInvalidArgument(
      SchemaChangeQueryBuilder::ValidateTableDefinition(unnamed_index)));
}

TEST(SchemaChangeQueryBuilderTest, ShadowTableName) {
  EXPECT_EQ(SchemaChangeQueryBuilder::GetShadowTableName("manifests"),
            "manifests_new");
}

}  // namespace
}  // namespace oci_metadata
