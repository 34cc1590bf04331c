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

#include <string>

#include <glog/logging.h>
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "oci_metadata/util/return_utils.h"

namespace oci_metadata {

absl::Status RdbmsTransactionExecutor::Execute(
    const std::function<absl::Status()>& txn_body,
    const TransactionOptions& transaction_options) const {
  if (metadata_source_ == nullptr || !metadata_source_->is_connected()) {
    return absl::FailedPreconditionError(
        "To use ExecuteTransaction, the metadata_source should be created and "
        "connected");
  }

  OCIMD_RETURN_IF_ERROR(metadata_source_->Begin());
  absl::Status status = txn_body();
  if (status.ok()) {
    status = metadata_source_->Commit();
    if (status.ok()) return absl::OkStatus();
  }

  // The body or the commit failed; the transaction is still open.
  const std::string tag = transaction_options.has_tag()
                              ? absl::StrCat(" ", transaction_options.tag())
                              : std::string();
  LOG(WARNING) << "Rolling back transaction" << tag << ": " << status;
  const absl::Status rollback_status = metadata_source_->Rollback();
  if (!rollback_status.ok()) {
    LOG(ERROR) << "Rollback of transaction" << tag
               << " failed: " << rollback_status;
  }
  return status;
}

}  // namespace oci_metadata
