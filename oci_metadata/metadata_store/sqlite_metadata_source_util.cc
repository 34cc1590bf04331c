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
#include "oci_metadata/metadata_store/sqlite_metadata_source_util.h"

#include <string>

#include "absl/strings/string_view.h"
#include "oci_metadata/metadata_store/constants.h"
#include "oci_metadata/proto/metadata_source.pb.h"
#include "sqlite3.h"

namespace oci_metadata {

std::string SqliteEscapeString(absl::string_view value) {
  // The precision bounds %q by bytes, so `value` needs no terminator.
  char* escaped = sqlite3_mprintf("%.*q", static_cast<int>(value.size()),
                                  value.data());  // NOLINT
  std::string result(escaped);
  sqlite3_free(escaped);
  return result;
}

int ConvertSqliteResultsToRecordSet(void* results, int column_num,
                                    char** column_vals, char** column_names) {
  RecordSet* record_set = static_cast<RecordSet*>(results);
  // Statements without a result set, or callers not asking for one.
  if (column_num == 0 || record_set == nullptr) return SQLITE_OK;
  // The callback runs once per row. The header is taken from the first row
  // whose width differs from the names held so far.
  const bool take_header = record_set->column_names_size() != column_num;
  if (take_header) record_set->clear_column_names();
  RecordSet::Record* record = record_set->add_records();
  for (int i = 0; i < column_num; ++i) {
    if (take_header) record_set->add_column_names(column_names[i]);
    if (column_vals[i] == nullptr) {
      record->add_values(std::string(kMetadataSourceNull));
    } else {
      record->add_values(column_vals[i]);
    }
  }
  return SQLITE_OK;
}

}  // namespace oci_metadata
