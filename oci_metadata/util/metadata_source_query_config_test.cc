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
#include "oci_metadata/util/metadata_source_query_config.h"

#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "oci_metadata/query/schema_change_query_builder.h"

namespace oci_metadata {
namespace util {
namespace {

TEST(MetadataSourceQueryConfig, GetSqliteMetadataSourceQueryConfig) {
  const MetadataSourceQueryConfig config = GetSqliteMetadataSourceQueryConfig();
  EXPECT_EQ(config.metadata_source_type(), SQLITE_METADATA_SOURCE);
  EXPECT_EQ(config.schema_version(), 2);
  EXPECT_EQ(config.secondary_indices_size(), 2);
}

TEST(MetadataSourceQueryConfig, EveryVersionHasAMigrationScheme) {
  const MetadataSourceQueryConfig config = GetSqliteMetadataSourceQueryConfig();
  for (int64_t version = 1; version <= config.schema_version(); ++version) {
    const auto it = config.migration_schemes().find(version);
    ASSERT_TRUE(it != config.migration_schemes().end()) << version;
    EXPECT_TRUE(it->second.has_db_verification()) << version;
  }
  const auto head = config.migration_schemes().find(config.schema_version());
  EXPECT_TRUE(head->second.has_upgrade_schema_change());
  EXPECT_EQ(head->second.db_verification().total_num_tables(), 3);
  EXPECT_EQ(head->second.db_verification().total_num_indexes(), 2);
}

TEST(MetadataSourceQueryConfig, SchemaChangesAreWellFormed) {
  const MetadataSourceQueryConfig config = GetSqliteMetadataSourceQueryConfig();
  for (const auto& entry : config.migration_schemes()) {
    const MetadataSourceQueryConfig::MigrationScheme& scheme = entry.second;
    if (scheme.has_upgrade_schema_change()) {
      SchemaChangeQueryBuilder builder(scheme.upgrade_schema_change());
      EXPECT_EQ(absl::OkStatus(), builder.Validate()) << entry.first;
    }
    if (scheme.has_downgrade_schema_change()) {
      SchemaChangeQueryBuilder builder(scheme.downgrade_schema_change());
      EXPECT_EQ(absl::OkStatus(), builder.Validate()) << entry.first;
    }
  }
}

}  // namespace
}  // namespace util
}  // namespace oci_metadata
