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

#include <string>

#include <glog/logging.h>
#include "google/protobuf/text_format.h"
#include "absl/strings/str_cat.h"
#include "oci_metadata/proto/metadata_source.pb.h"

namespace oci_metadata {
namespace util {
namespace {

// clang-format off

// The template queries of the head schema used by the MetadataAccessObject.
const std::string kBaseQueryConfig = absl::StrCat(  // NOLINT
R"pb(
  schema_version: 2
  drop_env_table { query: " DROP TABLE IF EXISTS `OciEnv`; " }
  create_env_table {
    query: " CREATE TABLE IF NOT EXISTS `OciEnv` ( "
           "   `schema_version` INTEGER PRIMARY KEY "
           " ); "
  }
  check_env_table {
    query: " SELECT `schema_version` FROM `OciEnv`; "
  }
  insert_schema_version {
    query: " INSERT INTO `OciEnv`(`schema_version`) VALUES($0); "
    parameter_num: 1
  }
  update_schema_version {
    query: " UPDATE `OciEnv` SET `schema_version` = $0; "
    parameter_num: 1
  }
  drop_image_table { query: " DROP TABLE IF EXISTS `images`; " }
  create_image_table {
    query: " CREATE TABLE IF NOT EXISTS `images` ( "
           "   `id` INTEGER PRIMARY KEY, "
           "   `reference` TEXT NOT NULL UNIQUE, "
           "   `size_bytes` INTEGER NOT NULL DEFAULT 0, "
           "   `last_used_at` DATETIME, "
           "   `created_at` DATETIME DEFAULT CURRENT_TIMESTAMP, "
           "   `modified_at` DATETIME DEFAULT CURRENT_TIMESTAMP "
           " ); "
  }
  check_image_table {
    query: " SELECT `id`, `reference`, `size_bytes`, `last_used_at`, "
           "        `created_at`, `modified_at` "
           " FROM `images` LIMIT 1; "
  }
  insert_image {
    query: " INSERT INTO `images`(`reference`, `size_bytes`, `last_used_at`) "
           " VALUES($0, $1, CURRENT_TIMESTAMP); "
    parameter_num: 2
  }
  touch_image {
    query: " UPDATE `images` "
           " SET `size_bytes` = $1, `last_used_at` = CURRENT_TIMESTAMP, "
           "     `modified_at` = CURRENT_TIMESTAMP "
           " WHERE `id` = $0; "
    parameter_num: 2
  }
  select_images_by_id {
    query: " SELECT `id`, `reference`, `size_bytes`, `last_used_at`, "
           "        `created_at`, `modified_at` "
           " FROM `images` WHERE `id` IN ($0) ORDER BY `id`; "
    parameter_num: 1
  }
  select_image_by_reference {
    query: " SELECT `id`, `reference`, `size_bytes`, `last_used_at`, "
           "        `created_at`, `modified_at` "
           " FROM `images` WHERE `reference` = $0; "
    parameter_num: 1
  }
  delete_images_by_id {
    query: " DELETE FROM `images` WHERE `id` IN ($0); "
    parameter_num: 1
  }
  drop_manifest_table { query: " DROP TABLE IF EXISTS `manifests`; " }
  # `indexes` was retired in version 2.
  drop_retired_tables { query: " DROP TABLE IF EXISTS `indexes`; " }
  create_manifest_table {
    query: " CREATE TABLE IF NOT EXISTS `manifests` ( "
           "   `id` INTEGER PRIMARY KEY, "
           "   `image_id` INTEGER NOT NULL, "
           "   `schema_version` INTEGER NOT NULL, "
           "   `media_type` TEXT NOT NULL, "
           "   `annotations_json` TEXT, "
           "   `created_at` DATETIME DEFAULT CURRENT_TIMESTAMP, "
           "   `modified_at` DATETIME DEFAULT CURRENT_TIMESTAMP, "
           "   FOREIGN KEY (`image_id`) REFERENCES `images`(`id`) "
           "     ON DELETE CASCADE "
           " ); "
  }
  check_manifest_table {
    query: " SELECT `id`, `image_id`, `schema_version`, `media_type`, "
           "        `annotations_json`, `created_at`, `modified_at` "
           " FROM `manifests` LIMIT 1; "
  }
  insert_manifest {
    query: " INSERT INTO `manifests`( "
           "   `image_id`, `schema_version`, `media_type`, `annotations_json` "
           " ) VALUES($0, $1, $2, $3); "
    parameter_num: 4
  }
  select_manifests_by_id {
    query: " SELECT `id`, `image_id`, `schema_version`, `media_type`, "
           "        `annotations_json`, `created_at`, `modified_at` "
           " FROM `manifests` WHERE `id` IN ($0) ORDER BY `id`; "
    parameter_num: 1
  }
  select_manifests_by_image_id {
    query: " SELECT `id`, `image_id`, `schema_version`, `media_type`, "
           "        `annotations_json`, `created_at`, `modified_at` "
           " FROM `manifests` WHERE `image_id` = $0 ORDER BY `id`; "
    parameter_num: 1
  }
)pb");

// The SQLite specific queries, and the migration schemes between schema
// versions.
const std::string kSQLiteMetadataSourceQueryConfig = absl::StrCat(  // NOLINT
R"pb(
  metadata_source_type: SQLITE_METADATA_SOURCE
  select_last_insert_id { query: " SELECT last_insert_rowid(); " }
  # secondary indices in the current schema.
  secondary_indices {
    query: " CREATE INDEX IF NOT EXISTS `idx_images_reference` "
           " ON `images`(`reference`); "
  }
  secondary_indices {
    query: " CREATE INDEX IF NOT EXISTS `idx_manifests_image_id` "
           " ON `manifests`(`image_id`); "
  }
)pb",
R"pb(
  # version 1: manifests belong to an index set through `index_id`.
  migration_schemes {
    key: 1
    value: {
      # downgrade from 2: bring back an empty `indexes` table, and rebuild
      # `manifests` with a NULL `index_id` for every row.
      downgrade_schema_change {
        created_tables {
          name: "indexes"
          columns { name: "id" sql_type: "INTEGER" primary_key: true }
          columns { name: "image_id" sql_type: "INTEGER" not_null: true }
          columns { name: "schema_version" sql_type: "INTEGER" not_null: true }
          columns { name: "media_type" sql_type: "TEXT" not_null: true }
          columns { name: "platform_os" sql_type: "TEXT" }
          columns { name: "platform_arch" sql_type: "TEXT" }
          columns { name: "platform_variant" sql_type: "TEXT" }
          columns { name: "annotations_json" sql_type: "TEXT" }
          columns {
            name: "created_at"
            sql_type: "DATETIME"
            default_value: "CURRENT_TIMESTAMP"
          }
          columns {
            name: "modified_at"
            sql_type: "DATETIME"
            default_value: "CURRENT_TIMESTAMP"
          }
          foreign_keys {
            column: "image_id"
            referenced_table: "images"
            referenced_column: "id"
            on_delete: CASCADE
          }
          indices { name: "idx_indexes_image_id" columns: "image_id" }
        }
        rebuilt_tables {
          name: "manifests"
          columns { name: "id" sql_type: "INTEGER" primary_key: true }
          columns { name: "index_id" sql_type: "INTEGER" is_new: true }
          columns { name: "image_id" sql_type: "INTEGER" not_null: true }
          columns { name: "schema_version" sql_type: "INTEGER" not_null: true }
          columns { name: "media_type" sql_type: "TEXT" not_null: true }
          columns { name: "annotations_json" sql_type: "TEXT" }
          columns {
            name: "created_at"
            sql_type: "DATETIME"
            default_value: "CURRENT_TIMESTAMP"
          }
          columns {
            name: "modified_at"
            sql_type: "DATETIME"
            default_value: "CURRENT_TIMESTAMP"
          }
          foreign_keys {
            column: "index_id"
            referenced_table: "indexes"
            referenced_column: "id"
            on_delete: CASCADE
          }
          foreign_keys {
            column: "image_id"
            referenced_table: "images"
            referenced_column: "id"
            on_delete: CASCADE
          }
          indices { name: "idx_manifests_index_id" columns: "index_id" }
          indices { name: "idx_manifests_image_id" columns: "image_id" }
        }
      }
      downgrade_verification {
        previous_version_setup_queries {
          query: " INSERT INTO `images`(`id`, `reference`, `size_bytes`) "
                 " VALUES (7, 'docker.io/library/alpine:latest', 3400000); "
        }
        previous_version_setup_queries {
          query: " INSERT INTO `manifests`( "
                 "   `id`, `image_id`, `schema_version`, `media_type`, "
                 "   `annotations_json`, `created_at`, `modified_at` "
                 " ) VALUES (1, 7, 2, "
                 "   'application/vnd.oci.image.manifest.v1+json', NULL, "
                 "   '2025-11-17 07:17:23', '2025-11-17 07:17:23'); "
        }
        post_migration_verification_queries {
          query: " SELECT count(*) = 1 FROM `manifests` "
                 " WHERE `id` = 1 AND `index_id` IS NULL AND `image_id` = 7 "
                 "   AND `schema_version` = 2 "
                 "   AND `media_type` = "
                 "       'application/vnd.oci.image.manifest.v1+json' "
                 "   AND `annotations_json` IS NULL "
                 "   AND `created_at` = '2025-11-17 07:17:23' "
                 "   AND `modified_at` = '2025-11-17 07:17:23'; "
        }
        post_migration_verification_queries {
          query: " SELECT count(*) = 0 FROM `indexes`; "
        }
        post_migration_verification_queries {
          query: " SELECT count(*) = 3 FROM `sqlite_master` "
                 " WHERE `type` = 'index' AND `name` IN ( "
                 "   'idx_indexes_image_id', 'idx_manifests_index_id', "
                 "   'idx_manifests_image_id'); "
        }
      }
      db_verification { total_num_indexes: 4 total_num_tables: 4 }
    }
  }
)pb",
R"pb(
  # version 2: `index_id` is removed from `manifests`, and the `indexes`
  # table is retired.
  migration_schemes {
    key: 2
    value: {
      upgrade_schema_change {
        rebuilt_tables {
          name: "manifests"
          columns { name: "id" sql_type: "INTEGER" primary_key: true }
          columns { name: "image_id" sql_type: "INTEGER" not_null: true }
          columns { name: "schema_version" sql_type: "INTEGER" not_null: true }
          columns { name: "media_type" sql_type: "TEXT" not_null: true }
          columns { name: "annotations_json" sql_type: "TEXT" }
          columns {
            name: "created_at"
            sql_type: "DATETIME"
            default_value: "CURRENT_TIMESTAMP"
          }
          columns {
            name: "modified_at"
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
        }
        retired_tables: "indexes"
      }
      upgrade_verification {
        previous_version_setup_queries {
          query: " CREATE TABLE IF NOT EXISTS `images` ( "
                 "   `id` INTEGER PRIMARY KEY, "
                 "   `reference` TEXT NOT NULL UNIQUE, "
                 "   `size_bytes` INTEGER NOT NULL DEFAULT 0, "
                 "   `last_used_at` DATETIME, "
                 "   `created_at` DATETIME DEFAULT CURRENT_TIMESTAMP, "
                 "   `modified_at` DATETIME DEFAULT CURRENT_TIMESTAMP "
                 " ); "
        }
        previous_version_setup_queries {
          query: " CREATE TABLE IF NOT EXISTS `indexes` ( "
                 "   `id` INTEGER PRIMARY KEY, "
                 "   `image_id` INTEGER NOT NULL, "
                 "   `schema_version` INTEGER NOT NULL, "
                 "   `media_type` TEXT NOT NULL, "
                 "   `platform_os` TEXT, "
                 "   `platform_arch` TEXT, "
                 "   `platform_variant` TEXT, "
                 "   `annotations_json` TEXT, "
                 "   `created_at` DATETIME DEFAULT CURRENT_TIMESTAMP, "
                 "   `modified_at` DATETIME DEFAULT CURRENT_TIMESTAMP, "
                 "   FOREIGN KEY (`image_id`) REFERENCES `images`(`id`) "
                 "     ON DELETE CASCADE "
                 " ); "
        }
        previous_version_setup_queries {
          query: " CREATE TABLE IF NOT EXISTS `manifests` ( "
                 "   `id` INTEGER PRIMARY KEY, "
                 "   `index_id` INTEGER, "
                 "   `image_id` INTEGER NOT NULL, "
                 "   `schema_version` INTEGER NOT NULL, "
                 "   `media_type` TEXT NOT NULL, "
                 "   `annotations_json` TEXT, "
                 "   `created_at` DATETIME DEFAULT CURRENT_TIMESTAMP, "
                 "   `modified_at` DATETIME DEFAULT CURRENT_TIMESTAMP, "
                 "   FOREIGN KEY (`index_id`) REFERENCES `indexes`(`id`) "
                 "     ON DELETE CASCADE, "
                 "   FOREIGN KEY (`image_id`) REFERENCES `images`(`id`) "
                 "     ON DELETE CASCADE "
                 " ); "
        }
        previous_version_setup_queries {
          query: " CREATE INDEX IF NOT EXISTS `idx_images_reference` "
                 " ON `images`(`reference`); "
        }
        previous_version_setup_queries {
          query: " CREATE INDEX IF NOT EXISTS `idx_indexes_image_id` "
                 " ON `indexes`(`image_id`); "
        }
        previous_version_setup_queries {
          query: " CREATE INDEX IF NOT EXISTS `idx_manifests_index_id` "
                 " ON `manifests`(`index_id`); "
        }
        previous_version_setup_queries {
          query: " CREATE INDEX IF NOT EXISTS `idx_manifests_image_id` "
                 " ON `manifests`(`image_id`); "
        }
        previous_version_setup_queries {
          query: " CREATE TABLE IF NOT EXISTS `OciEnv` ( "
                 "   `schema_version` INTEGER PRIMARY KEY "
                 " ); "
        }
        previous_version_setup_queries {
          query: " INSERT INTO `OciEnv`(`schema_version`) VALUES (1); "
        }
        previous_version_setup_queries {
          query: " INSERT INTO `images`(`id`, `reference`, `size_bytes`) "
                 " VALUES (7, 'docker.io/library/alpine:latest', 3400000); "
        }
        previous_version_setup_queries {
          query: " INSERT INTO `indexes`( "
                 "   `id`, `image_id`, `schema_version`, `media_type` "
                 " ) VALUES (99, 7, 2, "
                 "   'application/vnd.oci.image.index.v1+json'); "
        }
        previous_version_setup_queries {
          query: " INSERT INTO `manifests`( "
                 "   `id`, `index_id`, `image_id`, `schema_version`, "
                 "   `media_type`, `annotations_json`, `created_at`, "
                 "   `modified_at` "
                 " ) VALUES (1, 99, 7, 2, "
                 "   'application/vnd.oci.image.manifest.v1+json', NULL, "
                 "   '2025-11-17 07:17:23', '2025-11-17 07:17:23'); "
        }
        post_migration_verification_queries {
          query: " SELECT count(*) = 1 FROM `manifests` "
                 " WHERE `id` = 1 AND `image_id` = 7 "
                 "   AND `schema_version` = 2 "
                 "   AND `media_type` = "
                 "       'application/vnd.oci.image.manifest.v1+json' "
                 "   AND `annotations_json` IS NULL "
                 "   AND `created_at` = '2025-11-17 07:17:23' "
                 "   AND `modified_at` = '2025-11-17 07:17:23'; "
        }
        post_migration_verification_queries {
          query: " SELECT count(*) = 0 FROM pragma_table_info('manifests') "
                 " WHERE `name` = 'index_id'; "
        }
        post_migration_verification_queries {
          query: " SELECT count(*) = 0 FROM `sqlite_master` "
                 " WHERE `type` = 'table' AND `name` = 'indexes'; "
        }
        post_migration_verification_queries {
          query: " SELECT count(*) = 1 FROM `sqlite_master` "
                 " WHERE `type` = 'index' "
                 "   AND `name` = 'idx_manifests_image_id'; "
        }
      }
      db_verification { total_num_indexes: 2 total_num_tables: 3 }
    }
  }
)pb");

// clang-format on

}  // namespace

MetadataSourceQueryConfig GetSqliteMetadataSourceQueryConfig() {
  MetadataSourceQueryConfig config;
  CHECK(google::protobuf::TextFormat::ParseFromString(kBaseQueryConfig,
                                                      &config));
  MetadataSourceQueryConfig sqlite_config;
  CHECK(google::protobuf::TextFormat::ParseFromString(
      kSQLiteMetadataSourceQueryConfig, &sqlite_config));
  config.MergeFrom(sqlite_config);
  return config;
}

}  // namespace util
}  // namespace oci_metadata
