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
#include "oci_metadata/metadata_store/metadata_source.h"

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "oci_metadata/util/return_utils.h"

namespace oci_metadata {
namespace {

absl::Status CheckConnected(const bool is_connected,
                            absl::string_view operation) {
  if (!is_connected) {
    return absl::FailedPreconditionError(
        absl::StrCat("No opened connection for ", operation, "."));
  }
  return absl::OkStatus();
}

// Returns FAILED_PRECONDITION unless the transaction state is `expected`.
absl::Status CheckTransaction(const bool in_transaction,
                              const bool expected,
                              absl::string_view operation) {
  if (in_transaction != expected) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Cannot ", operation, ": transaction ",
        in_transaction ? "already open." : "not open."));
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status MetadataSource::Connect() {
  if (is_connected_) {
    return absl::FailedPreconditionError(
        "The connection has been opened. Close() the current connection before "
        "Connect() again.");
  }
  OCIMD_RETURN_IF_ERROR(ConnectImpl());
  is_connected_ = true;
  return absl::OkStatus();
}

absl::Status MetadataSource::Close() {
  OCIMD_RETURN_IF_ERROR(CheckConnected(is_connected_, "Close()"));
  OCIMD_RETURN_IF_ERROR(CloseImpl());
  // Closing the connection discards any open transaction.
  is_connected_ = false;
  transaction_open_ = false;
  return absl::OkStatus();
}

absl::Status MetadataSource::ExecuteQuery(const std::string& query,
                                          RecordSet* results) {
  OCIMD_RETURN_IF_ERROR(CheckConnected(is_connected_, "querying"));
  OCIMD_RETURN_IF_ERROR(
      CheckTransaction(transaction_open_, /*expected=*/true, "execute query"));
  return ExecuteQueryImpl(query, results);
}

absl::Status MetadataSource::Begin() {
  OCIMD_RETURN_IF_ERROR(CheckConnected(is_connected_, "Begin()"));
  OCIMD_RETURN_IF_ERROR(
      CheckTransaction(transaction_open_, /*expected=*/false, "begin"));
  OCIMD_RETURN_IF_ERROR(BeginImpl());
  transaction_open_ = true;
  return absl::OkStatus();
}

absl::Status MetadataSource::Commit() {
  OCIMD_RETURN_IF_ERROR(CheckConnected(is_connected_, "Commit()"));
  OCIMD_RETURN_IF_ERROR(
      CheckTransaction(transaction_open_, /*expected=*/true, "commit"));
  OCIMD_RETURN_IF_ERROR(CommitImpl());
  transaction_open_ = false;
  return absl::OkStatus();
}

absl::Status MetadataSource::Rollback() {
  OCIMD_RETURN_IF_ERROR(CheckConnected(is_connected_, "Rollback()"));
  OCIMD_RETURN_IF_ERROR(
      CheckTransaction(transaction_open_, /*expected=*/true, "rollback"));
  // A failed rollback still ends the transaction on the client side; sqlite
  // may have rolled it back on its own already.
  const absl::Status status = RollbackImpl();
  transaction_open_ = false;
  return status;
}

}  // namespace oci_metadata
