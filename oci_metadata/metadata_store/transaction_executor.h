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
#ifndef OCI_METADATA_METADATA_STORE_TRANSACTION_EXECUTOR_H_
#define OCI_METADATA_METADATA_STORE_TRANSACTION_EXECUTOR_H_

#include <functional>

#include "absl/status/status.h"
#include "oci_metadata/metadata_store/metadata_source.h"
#include "oci_metadata/proto/metadata_store.pb.h"

namespace oci_metadata {

// Pure virtual interface for MetadataStore to execute a transaction.
//
// Example usage:
//    TransactionExecutor* txn_executor;
//    ...
//    txn_executor->Execute(
//     [&metadata_access_object]() -> absl::Status {
//        return metadata_access_object->InitMetadataSource();
//     });
class TransactionExecutor {
 public:
  virtual ~TransactionExecutor() = default;

  // Runs txn_body and return the transaction status.
  virtual absl::Status Execute(
      const std::function<absl::Status()>& txn_body,
      const TransactionOptions& transaction_options = TransactionOptions())
      const = 0;
};

// Runs the transaction body between MetadataSource Begin and Commit. Every
// exit path other than a successful commit ends in a Rollback, so a schema
// migration either lands completely or leaves the database untouched.
class RdbmsTransactionExecutor : public TransactionExecutor {
 public:
  explicit RdbmsTransactionExecutor(MetadataSource* metadata_source)
      : metadata_source_(metadata_source) {}
  ~RdbmsTransactionExecutor() override = default;

  // When the txn_body returns OK, it calls Commit, otherwise it calls Rollback.
  // A failed Commit is rolled back too.
  //
  // Returns FAILED_PRECONDITION if metadata_source is null or not connected.
  // Returns the txn_body error, or detailed errors of Begin and Commit.
  absl::Status Execute(const std::function<absl::Status()>& txn_body,
                       const TransactionOptions& transaction_options =
                           TransactionOptions()) const override;

 private:
  // Not owned by this class.
  MetadataSource* metadata_source_;
};

}  // namespace oci_metadata

#endif  // OCI_METADATA_METADATA_STORE_TRANSACTION_EXECUTOR_H_
