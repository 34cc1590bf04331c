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
#ifndef OCI_METADATA_METADATA_STORE_METADATA_SOURCE_H_
#define OCI_METADATA_METADATA_STORE_METADATA_SOURCE_H_

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "oci_metadata/proto/metadata_source.pb.h"

namespace oci_metadata {

// The base class for all metadata data sources. Each concrete MetadataSource
// provides a physical backend to persist and query image metadata. An
// implementation of MetadataSource must implement transactions, and
// MetadataSource queries must be executed within transactions.
//
// Usage example:
//
//    SomeConcreteMetadataSource src;
//    CHECK_EQ(absl::OkStatus(), src.Connect());
//    CHECK_EQ(absl::OkStatus(), src.Begin());
//    CHECK_EQ(absl::OkStatus(),
//             src.ExecuteQuery("create table foo(bar int)", nullptr));
//    CHECK_EQ(absl::OkStatus(),
//             src.ExecuteQuery("insert into foo values (1)", nullptr));
//    RecordSet results;
//    CHECK_EQ(absl::OkStatus(), src.ExecuteQuery("select * from foo",
//                                                &results));
//    for (const RecordSet::Record& row : results.records()) {
//       // process row values
//    }
//    CHECK_EQ(absl::OkStatus(), src.Commit());
//    CHECK_EQ(absl::OkStatus(), src.Close());
//
// In order to avoid unpaired Begin() and Commit(), the user can access
// the MetadataSource through a TransactionExecutor.
class MetadataSource {
 public:
  MetadataSource() = default;
  // Releases opened resources if any during destruction.
  virtual ~MetadataSource() = default;

  // Disallows copy.
  MetadataSource(const MetadataSource&) = delete;
  MetadataSource& operator=(const MetadataSource&) = delete;

  // Establishes connection to the physical data source. This method should be
  // called before other methods to store or query metadata from the datasource.
  // Returns FAILED_PRECONDITION error, if calls Connect again without Close.
  absl::Status Connect();

  // Closes any opened connections, and release any resource. After closing a
  // connection, new connections can be opened again.
  // Returns FAILED_PRECONDITION error, if calls Close without a connection.
  absl::Status Close();

  // Runs DDL and DML query on data source within the open transaction.
  // Results are consist of zero or more rows represented in RecordSet.
  // Returns FAILED_PRECONDITION error, if Connection() is not opened.
  // Returns FAILED_PRECONDITION error, if a transaction has not begun.
  // Returns detailed INTERNAL error, if query execution fails.
  absl::Status ExecuteQuery(const std::string& query, RecordSet* results);

  // Begins (opens) a transaction.
  // Returns FAILED_PRECONDITION error, if Connection() is not opened.
  // Returns FAILED_PRECONDITION error, if a transaction has already begun.
  absl::Status Begin();

  // Commits a transaction.
  // Returns FAILED_PRECONDITION error, if Connection() is not opened.
  // Returns FAILED_PRECONDITION error, if a transaction has not begun.
  // Returns ABORTED error, if there is a data race detected at commit time.
  // The caller can rollback the transaction, and retry the transaction again.
  absl::Status Commit();

  // Rolls back a transaction. Undoes all uncommitted queries, including the
  // DDL queries of a schema migration.
  // Returns FAILED_PRECONDITION error, if Connection() is not opened.
  // Returns FAILED_PRECONDITION error, if a transaction has not begun.
  absl::Status Rollback();

  // Utility method to escape characters specific to the metadata source. The
  // returned string is used to bind text parameters for query composition.
  virtual std::string EscapeString(absl::string_view value) const = 0;

  bool is_connected() const { return is_connected_; }

 private:
  // Implementation of connecting to a backend.
  virtual absl::Status ConnectImpl() = 0;

  // Implementation of closing the current connection.
  virtual absl::Status CloseImpl() = 0;

  // Implementation of executing queries.
  virtual absl::Status ExecuteQueryImpl(const std::string& query,
                                        RecordSet* results) = 0;

  // Implementation of opening a transaction.
  virtual absl::Status BeginImpl() = 0;

  // Implementation of a transaction commit.
  virtual absl::Status CommitImpl() = 0;

  // Implementation of a transaction rollback.
  virtual absl::Status RollbackImpl() = 0;

  bool is_connected_ = false;
  bool transaction_open_ = false;
};

}  // namespace oci_metadata

#endif  // OCI_METADATA_METADATA_STORE_METADATA_SOURCE_H_
