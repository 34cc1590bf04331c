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
#include "oci_metadata/metadata_store/metadata_source_test_suite.h"

#include <memory>
#include <string>

#include <gmock/gmock.h>
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "oci_metadata/metadata_store/constants.h"
#include "oci_metadata/metadata_store/test_util.h"

namespace oci_metadata {
namespace testing {
namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;

// Execution: Insert a new row (1,'v1') into t1.
// Expectation: all the retrieved rows in t1 are (1, 'v1').
TEST_P(MetadataSourceTestSuite, TestInsert) {
  metadata_source_container_->InitTestSchema();
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Begin());
  ASSERT_EQ(absl::OkStatus(), metadata_source_->ExecuteQuery(
                                  "INSERT INTO t1 VALUES (1, 'v1')", nullptr));
  RecordSet expected_results = ParseTextProtoOrDie<RecordSet>(
      R"(column_names: "c1"
         column_names: "c2"
         records: { values: "1" values: "v1" })");

  RecordSet query_results;
  ASSERT_EQ(absl::OkStatus(),
            metadata_source_->ExecuteQuery("SELECT * FROM t1", &query_results));
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Commit());
  EXPECT_THAT(query_results, EqualsProto(expected_results));
}

TEST_P(MetadataSourceTestSuite, TestInsertWithEscapedStringValue) {
  metadata_source_container_->InitTestSchema();
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Begin());
  ASSERT_EQ(absl::OkStatus(),
            metadata_source_->ExecuteQuery(
                absl::StrCat("INSERT INTO t1 VALUES (1, '",
                             metadata_source_->EscapeString("it's"), "')"),
                nullptr));
  RecordSet query_results;
  ASSERT_EQ(absl::OkStatus(),
            metadata_source_->ExecuteQuery("SELECT * FROM t1", &query_results));
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Commit());
  EXPECT_THAT(query_results,
              EqualsProto(ParseTextProtoOrDie<RecordSet>(
                  R"(column_names: "c1"
                     column_names: "c2"
                     records: { values: "1" values: "it's" })")));
}

// Execution: Update c2 to 'v100' in rows where c1 = 1 in table t1.
TEST_P(MetadataSourceTestSuite, TestUpdate) {
  metadata_source_container_->InitSchemaAndPopulateRows();
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Begin());
  ASSERT_EQ(absl::OkStatus(),
            metadata_source_->ExecuteQuery(
                "UPDATE t1 SET c2 = 'v100' WHERE c1 = 1", nullptr));
  RecordSet query_results;
  ASSERT_EQ(absl::OkStatus(),
            metadata_source_->ExecuteQuery("SELECT * FROM t1 WHERE c1 = 1",
                                           &query_results));
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Commit());
  EXPECT_THAT(query_results,
              EqualsProto(ParseTextProtoOrDie<RecordSet>(
                  R"(column_names: "c1"
                     column_names: "c2"
                     records: { values: "1" values: "v100" })")));
}

TEST_P(MetadataSourceTestSuite, TestQueryWithoutConnect) {
  absl::Status s =
      metadata_source_->ExecuteQuery("CREATE TABLE foo(bar INT)", nullptr);
  EXPECT_TRUE(absl::IsFailedPrecondition(s));
  EXPECT_THAT(std::string(s.message()), HasSubstr("No opened connection"));
}

TEST_P(MetadataSourceTestSuite, TestQueryWithoutTransaction) {
  metadata_source_container_->InitTestSchema();
  absl::Status s = metadata_source_->ExecuteQuery("SELECT * FROM t1", nullptr);
  EXPECT_TRUE(absl::IsFailedPrecondition(s));
  EXPECT_TRUE(absl::IsFailedPrecondition(metadata_source_->Commit()));
  EXPECT_TRUE(absl::IsFailedPrecondition(metadata_source_->Rollback()));
}

TEST_P(MetadataSourceTestSuite, TestBeginTwice) {
  metadata_source_container_->InitTestSchema();
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Begin());
  EXPECT_TRUE(absl::IsFailedPrecondition(metadata_source_->Begin()));
  EXPECT_EQ(absl::OkStatus(), metadata_source_->Rollback());
}

// Execution 1: Delete all the rows in t1 and then Rollback.
// Expectation 1: the retrieved rows remain the same.
// Execution 2: Insert 2 new rows into t1 and Commit.
// Expectation 2: 2 more rows were added in the original query results.
TEST_P(MetadataSourceTestSuite, TestMultiQueryTransaction) {
  metadata_source_container_->InitSchemaAndPopulateRows();
  RecordSet expected_results;
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Begin());
  ASSERT_EQ(absl::OkStatus(), metadata_source_->ExecuteQuery(
                                  "SELECT * FROM t1", &expected_results));
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Commit());

  ASSERT_EQ(absl::OkStatus(), metadata_source_->Begin());
  ASSERT_EQ(absl::OkStatus(),
            metadata_source_->ExecuteQuery("DELETE FROM t1", nullptr));
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Rollback());

  {
    RecordSet query_results;
    ASSERT_EQ(absl::OkStatus(), metadata_source_->Begin());
    ASSERT_EQ(absl::OkStatus(), metadata_source_->ExecuteQuery(
                                    "SELECT * FROM t1", &query_results));
    ASSERT_EQ(absl::OkStatus(), metadata_source_->Commit());
    EXPECT_THAT(query_results, EqualsProto(expected_results));
  }

  ASSERT_EQ(absl::OkStatus(), metadata_source_->Begin());
  ASSERT_EQ(absl::OkStatus(), metadata_source_->ExecuteQuery(
                                  "INSERT INTO t1 VALUES (4, 'v4')", nullptr));
  ASSERT_EQ(absl::OkStatus(), metadata_source_->ExecuteQuery(
                                  "INSERT INTO t1 VALUES (5, 'v5')", nullptr));
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Commit());

  {
    RecordSet query_results;
    ASSERT_EQ(absl::OkStatus(), metadata_source_->Begin());
    ASSERT_EQ(absl::OkStatus(), metadata_source_->ExecuteQuery(
                                    "SELECT * FROM t1", &query_results));
    ASSERT_EQ(absl::OkStatus(), metadata_source_->Commit());
    EXPECT_EQ(expected_results.records_size() + 2,
              query_results.records_size());
  }
}

// Schema changes are part of the transaction: a rolled back table rebuild
// leaves the original table and its rows in place.
TEST_P(MetadataSourceTestSuite, TestRollbackSchemaChange) {
  metadata_source_container_->InitSchemaAndPopulateRows();
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Begin());
  ASSERT_EQ(absl::OkStatus(),
            metadata_source_->ExecuteQuery(
                "CREATE TABLE t1_new (c1 INT, c2 TEXT, c3 TEXT)", nullptr));
  ASSERT_EQ(absl::OkStatus(),
            metadata_source_->ExecuteQuery(
                "INSERT INTO t1_new (c1, c2) SELECT c1, c2 FROM t1", nullptr));
  ASSERT_EQ(absl::OkStatus(),
            metadata_source_->ExecuteQuery("DROP TABLE t2", nullptr));
  ASSERT_EQ(absl::OkStatus(),
            metadata_source_->ExecuteQuery("DROP TABLE t1", nullptr));
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Rollback());

  RecordSet t1_rows;
  RecordSet t1_new;
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Begin());
  ASSERT_EQ(absl::OkStatus(),
            metadata_source_->ExecuteQuery("SELECT * FROM t1", &t1_rows));
  EXPECT_FALSE(
      metadata_source_->ExecuteQuery("SELECT * FROM t1_new", &t1_new).ok());
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Rollback());
  EXPECT_EQ(3, t1_rows.records_size());
  EXPECT_THAT(t1_new.records(), IsEmpty());
}

// Foreign keys are enforced on every connection.
TEST_P(MetadataSourceTestSuite, TestForeignKeyConstraint) {
  metadata_source_container_->InitSchemaAndPopulateRows();
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Begin());
  const absl::Status status = metadata_source_->ExecuteQuery(
      "INSERT INTO t2 VALUES (11, 42)", nullptr);
  EXPECT_FALSE(status.ok());
  EXPECT_THAT(std::string(status.message()), HasSubstr("FOREIGN KEY"));
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Rollback());
}

// Deleting a referenced row removes the referencing rows.
TEST_P(MetadataSourceTestSuite, TestDeleteCascades) {
  metadata_source_container_->InitSchemaAndPopulateRows();
  RecordSet query_results;
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Begin());
  ASSERT_EQ(absl::OkStatus(),
            metadata_source_->ExecuteQuery("SELECT * FROM t2", &query_results));
  EXPECT_THAT(query_results.records(), Not(IsEmpty()));
  ASSERT_EQ(absl::OkStatus(), metadata_source_->ExecuteQuery(
                                  "DELETE FROM t1 WHERE c1 = 1", nullptr));
  query_results.Clear();
  ASSERT_EQ(absl::OkStatus(),
            metadata_source_->ExecuteQuery("SELECT * FROM t2", &query_results));
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Commit());
  EXPECT_THAT(query_results.records(), IsEmpty());
}

// Execution: Insert a new row (1, NULL) into t1.
// Expectation: all the retrieved rows in t1 are (1, kMetadataSourceNull).
TEST_P(MetadataSourceTestSuite, TestNull) {
  metadata_source_container_->InitTestSchema();
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Begin());
  ASSERT_EQ(absl::OkStatus(), metadata_source_->ExecuteQuery(
                                  "INSERT INTO t1 VALUES (1, NULL)", nullptr));
  RecordSet query_results;
  ASSERT_EQ(absl::OkStatus(),
            metadata_source_->ExecuteQuery("SELECT * FROM t1", &query_results));
  ASSERT_EQ(absl::OkStatus(), metadata_source_->Commit());
  ASSERT_EQ(1, query_results.records_size());
  EXPECT_EQ(kMetadataSourceNull, query_results.records(0).values(1));
}

}  // namespace
}  // namespace testing
}  // namespace oci_metadata
