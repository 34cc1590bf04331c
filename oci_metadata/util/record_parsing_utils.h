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
#ifndef OCI_METADATA_UTIL_RECORD_PARSING_UTILS_H_
#define OCI_METADATA_UTIL_RECORD_PARSING_UTILS_H_

#include <vector>

#include <glog/logging.h>
#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "oci_metadata/proto/metadata_source.pb.h"
#include "oci_metadata/proto/metadata_store.pb.h"
#include "oci_metadata/util/return_utils.h"

namespace oci_metadata {

// Converts `record_set` to an Image array.
// Returns OK and the parsed result is outputted by `output_images`.
// Returns error when internal error happens.
absl::Status ParseRecordSetToImageArray(const RecordSet& record_set,
                                        std::vector<Image>& output_images);

// Converts `record_set` to a Manifest array.
// Returns OK and the parsed result is outputted by `output_manifests`.
// Returns error when internal error happens.
absl::Status ParseRecordSetToManifestArray(
    const RecordSet& record_set, std::vector<Manifest>& output_manifests);

// Parses `value` and assigns it to the field of `output_message` described by
// `field_descriptor`. A kMetadataSourceNull value leaves the field unset.
// Returns INTERNAL error, if the value cannot be parsed into the field type,
// or the field type is not supported.
absl::Status ParseValueToField(
    const google::protobuf::FieldDescriptor* field_descriptor,
    absl::string_view value, google::protobuf::Message& output_message);

// Converts a RecordSet in the query result to a MessageType. In the record at
// the `record_index`, its value of each column is assigned to a message field
// with the same field name as the column name. Columns without such a field
// are skipped.
template <typename MessageType>
absl::Status ParseRecordSetToMessage(const RecordSet& record_set,
                                     const int record_index,
                                     MessageType& output_message) {
  CHECK_LT(record_index, record_set.records_size());
  const google::protobuf::Descriptor* descriptor = output_message.descriptor();
  for (int i = 0; i < record_set.column_names_size(); i++) {
    const google::protobuf::FieldDescriptor* field_descriptor =
        descriptor->FindFieldByName(record_set.column_names(i));
    if (field_descriptor == nullptr) continue;
    OCIMD_RETURN_IF_ERROR(ParseValueToField(
        field_descriptor, record_set.records(record_index).values(i),
        output_message));
  }
  return absl::OkStatus();
}

// Converts every record of `record_set` to a MessageType.
template <typename MessageType>
absl::Status ParseRecordSetToMessageArray(
    const RecordSet& record_set, std::vector<MessageType>& output_messages) {
  for (int i = 0; i < record_set.records_size(); i++) {
    output_messages.push_back(MessageType());
    OCIMD_RETURN_IF_ERROR(
        ParseRecordSetToMessage(record_set, i, output_messages.back()));
  }
  return absl::OkStatus();
}

}  // namespace oci_metadata

#endif  // OCI_METADATA_UTIL_RECORD_PARSING_UTILS_H_
