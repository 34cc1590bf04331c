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
#include "oci_metadata/metadata_store/transaction_executor.h"

#include <functional>
#include <string>

#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "oci_metadata/metadata_store/metadata_source.h"

namespace oci_metadata {
namespace {

using ::testing::_;
using ::testing::Return;

class MockMetadataSource : public MetadataSource {
 public:
  MOCK_METHOD(absl::Status, BeginImpl, (), (override));
  MOCK_METHOD(absl::Status, ConnectImpl, (), (override));
  MOCK_METHOD(absl::Status, CloseImpl, (), (override));
  MOCK_METHOD(absl::Status, RollbackImpl, (), (override));
  MOCK_METHOD(absl::Status, CommitImpl, (), (override));
  MOCK_METHOD(absl::Status, ExecuteQueryImpl,
              (const std::string& query, RecordSet* results), (override));
  MOCK_METHOD(std::string, EscapeString, (absl::string_view value),
              (const, override));
};

// Fake Errors.
const absl::Status kFuncErrorStatus =
    absl::InternalError("Fake txn body error.");
const absl::Status kConnectErrorStatus =
    absl::InternalError("Fake connection error.");
const absl::Status kCommitErrorStatus =
    absl::InternalError("Fake commit error.");
const absl::Status kRollbackErrorStatus =
    absl::InternalError("Fake rollback error.");
const absl::Status kBeginErrorStatus = absl::InternalError("Fake begin error.");

// Fake transaction body that always return OK status.
const std::function<absl::Status()> kFuncReturnOk = []() -> absl::Status {
  return absl::OkStatus();
};
// Fake transaction body that always return Internal error status.
const std::function<absl::Status()> kFuncReturnInternalError =
    []() -> absl::Status { return kFuncErrorStatus; };

TEST(TransactionExecutorTest, ReturnOkWhenBothTxnBodyAndCommitOk) {
  MockMetadataSource mock_metadata_source;
  EXPECT_CALL(mock_metadata_source, ConnectImpl())
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_metadata_source, BeginImpl())
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_metadata_source, CommitImpl())
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_metadata_source, RollbackImpl()).Times(0);
  EXPECT_CALL(mock_metadata_source, CloseImpl()).Times(0);

  ASSERT_EQ(absl::OkStatus(), mock_metadata_source.Connect());
  RdbmsTransactionExecutor txn_executor(&mock_metadata_source);

  EXPECT_EQ(absl::OkStatus(), txn_executor.Execute(kFuncReturnOk));
}

TEST(TransactionExecutorTest, ReturnErrorWhenTxnBodyReturnsError) {
  MockMetadataSource mock_metadata_source;
  EXPECT_CALL(mock_metadata_source, ConnectImpl())
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_metadata_source, BeginImpl())
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_metadata_source, RollbackImpl())
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_metadata_source, CommitImpl()).Times(0);
  EXPECT_CALL(mock_metadata_source, CloseImpl()).Times(0);

  ASSERT_EQ(absl::OkStatus(), mock_metadata_source.Connect());
  RdbmsTransactionExecutor txn_executor(&mock_metadata_source);

  TransactionOptions options;
  options.set_tag("UpgradeMetadataSource");
  EXPECT_EQ(txn_executor.Execute(kFuncReturnInternalError, options),
            kFuncErrorStatus);
}

// A body that fails halfway leaves the statements it already ran to the
// rollback.
TEST(TransactionExecutorTest, RollbackAfterPartialBody) {
  MockMetadataSource mock_metadata_source;
  EXPECT_CALL(mock_metadata_source, ConnectImpl())
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_metadata_source, BeginImpl())
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_metadata_source, ExecuteQueryImpl(_, _))
      .WillOnce(Return(absl::OkStatus()))
      .WillOnce(Return(kFuncErrorStatus));
  EXPECT_CALL(mock_metadata_source, RollbackImpl())
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_metadata_source, CommitImpl()).Times(0);

  ASSERT_EQ(absl::OkStatus(), mock_metadata_source.Connect());
  RdbmsTransactionExecutor txn_executor(&mock_metadata_source);

  EXPECT_EQ(txn_executor.Execute([&mock_metadata_source]() -> absl::Status {
    absl::Status status = mock_metadata_source.ExecuteQuery(
        "CREATE TABLE IF NOT EXISTS `manifests_new` (`id` INTEGER);", nullptr);
    if (!status.ok()) return status;
    return mock_metadata_source.ExecuteQuery(
        "INSERT INTO `manifests_new` (`id`) SELECT `id` FROM `manifests`;",
        nullptr);
  }),
            kFuncErrorStatus);
  // The transaction is closed, so a new one can begin.
  EXPECT_CALL(mock_metadata_source, BeginImpl())
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_metadata_source, CommitImpl())
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_EQ(absl::OkStatus(), txn_executor.Execute(kFuncReturnOk));
}

TEST(TransactionExecutorTest, ReturnErrorWhenTxnBodyReturnsOkButCommitFails) {
  MockMetadataSource mock_metadata_source;
  EXPECT_CALL(mock_metadata_source, ConnectImpl())
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_metadata_source, BeginImpl())
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_metadata_source, CommitImpl())
      .WillOnce(Return(kCommitErrorStatus));
  EXPECT_CALL(mock_metadata_source, RollbackImpl())
      .WillOnce(Return(kRollbackErrorStatus));
  EXPECT_CALL(mock_metadata_source, CloseImpl()).Times(0);

  ASSERT_EQ(absl::OkStatus(), mock_metadata_source.Connect());
  RdbmsTransactionExecutor txn_executor(&mock_metadata_source);

  // Return commit error even rollback fails.
  EXPECT_EQ(txn_executor.Execute(kFuncReturnOk), kCommitErrorStatus);
}

TEST(TransactionExecutorTest, ReturnBeginErrorWithoutRunningBody) {
  MockMetadataSource mock_metadata_source;
  EXPECT_CALL(mock_metadata_source, ConnectImpl())
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_metadata_source, BeginImpl())
      .WillOnce(Return(kBeginErrorStatus));
  EXPECT_CALL(mock_metadata_source, CommitImpl()).Times(0);
  EXPECT_CALL(mock_metadata_source, RollbackImpl()).Times(0);

  ASSERT_EQ(absl::OkStatus(), mock_metadata_source.Connect());
  RdbmsTransactionExecutor txn_executor(&mock_metadata_source);

  bool body_ran = false;
  EXPECT_EQ(txn_executor.Execute([&body_ran]() -> absl::Status {
    body_ran = true;
    return absl::OkStatus();
  }),
            kBeginErrorStatus);
  EXPECT_FALSE(body_ran);
}

TEST(TransactionExecutorTest, ReturnConnectErrorWhenConnectFails) {
  MockMetadataSource mock_metadata_source;
  EXPECT_CALL(mock_metadata_source, ConnectImpl())
      .WillOnce(Return(kConnectErrorStatus));
  EXPECT_CALL(mock_metadata_source, CommitImpl()).Times(0);
  EXPECT_CALL(mock_metadata_source, RollbackImpl()).Times(0);
  EXPECT_CALL(mock_metadata_source, CloseImpl()).Times(0);

  EXPECT_EQ(mock_metadata_source.Connect(), kConnectErrorStatus);
  RdbmsTransactionExecutor txn_executor(&mock_metadata_source);

  EXPECT_EQ(txn_executor.Execute(kFuncReturnOk),
            absl::FailedPreconditionError(
                "To use ExecuteTransaction, the metadata_source should be "
                "created and connected"));
}

TEST(TransactionExecutorTest, ReturnErrorWithNullMetadataSource) {
  RdbmsTransactionExecutor txn_executor(nullptr);
  EXPECT_TRUE(absl::IsFailedPrecondition(txn_executor.Execute(kFuncReturnOk)));
}

}  // namespace
}  // namespace oci_metadata
