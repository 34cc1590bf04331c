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
#include "oci_metadata/util/record_parsing_utils.h"

#include <cstdint>
#include <string>
#include <vector>

#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"
#include "absl/status/status.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "oci_metadata/metadata_store/constants.h"

namespace oci_metadata {

absl::Status ParseRecordSetToImageArray(const RecordSet& record_set,
                                        std::vector<Image>& output_images) {
  return ParseRecordSetToMessageArray(record_set, output_images);
}

absl::Status ParseRecordSetToManifestArray(
    const RecordSet& record_set, std::vector<Manifest>& output_manifests) {
  return ParseRecordSetToMessageArray(record_set, output_manifests);
}

absl::Status ParseValueToField(
    const google::protobuf::FieldDescriptor* field_descriptor,
    absl::string_view value, google::protobuf::Message& output_message) {
  if (value == kMetadataSourceNull) {
    return absl::OkStatus();
  }
  if (field_descriptor->is_repeated()) {
    return absl::InternalError(
        absl::StrCat("Cannot parse a column into repeated field ",
                     field_descriptor->name()));
  }
  const google::protobuf::Reflection* reflection =
      output_message.GetReflection();
  switch (field_descriptor->cpp_type()) {
    case google::protobuf::FieldDescriptor::CppType::CPPTYPE_STRING: {
      reflection->SetString(&output_message, field_descriptor,
                            std::string(value));
      break;
    }
    case google::protobuf::FieldDescriptor::CppType::CPPTYPE_INT64: {
      int64_t int64_value;
      if (!absl::SimpleAtoi(value, &int64_value)) {
        return absl::InternalError(absl::StrCat(
            "Cannot parse ", field_descriptor->name(), " as int64: ", value));
      }
      reflection->SetInt64(&output_message, field_descriptor, int64_value);
      break;
    }
    case google::protobuf::FieldDescriptor::CppType::CPPTYPE_INT32: {
      int32_t int32_value;
      if (!absl::SimpleAtoi(value, &int32_value)) {
        return absl::InternalError(absl::StrCat(
            "Cannot parse ", field_descriptor->name(), " as int32: ", value));
      }
      reflection->SetInt32(&output_message, field_descriptor, int32_value);
      break;
    }
    case google::protobuf::FieldDescriptor::CppType::CPPTYPE_BOOL: {
      bool bool_value;
      if (!absl::SimpleAtob(value, &bool_value)) {
        return absl::InternalError(absl::StrCat(
            "Cannot parse ", field_descriptor->name(), " as bool: ", value));
      }
      reflection->SetBool(&output_message, field_descriptor, bool_value);
      break;
    }
    default: {
      return absl::InternalError(absl::StrCat(
          "Unsupported field type: ", field_descriptor->type_name(),
          " of field ", field_descriptor->name()));
    }
  }
  return absl::OkStatus();
}

}  // namespace oci_metadata
