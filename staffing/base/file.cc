// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#include "staffing/base/file.h"

#include <fstream>
#include <sstream>
#include <string>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/io/tokenizer.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"

namespace staffing::file {
namespace {

// Keeps the first error reported by the text-format parser.
class FirstErrorCollector : public google::protobuf::io::ErrorCollector {
 public:
  void AddError(int line, google::protobuf::io::ColumnNumber column,
                const std::string& message) override {
    if (!error_.empty()) return;
    // The parser reports zero-based positions.
    error_ = absl::StrCat("line ", line + 1, ", column ", column + 1, ": ",
                          message);
  }

  const std::string& error() const { return error_; }

 private:
  std::string error_;
};

}  // namespace

absl::StatusOr<std::string> GetContents(absl::string_view file_name) {
  std::ifstream stream{std::string(file_name), std::ios::in | std::ios::binary};
  if (!stream.is_open()) {
    return absl::NotFoundError(
        absl::StrCat("Could not open '", file_name, "' for reading."));
  }
  std::ostringstream contents;
  contents << stream.rdbuf();
  if (stream.bad()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not read from '", file_name, "'."));
  }
  return contents.str();
}

absl::Status SetContents(absl::string_view file_name,
                         absl::string_view contents) {
  std::ofstream stream{std::string(file_name),
                       std::ios::out | std::ios::binary | std::ios::trunc};
  if (!stream.is_open()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not open '", file_name, "' for writing."));
  }
  stream.write(contents.data(), contents.size());
  stream.close();
  if (stream.fail()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not write to '", file_name, "'."));
  }
  return absl::OkStatus();
}

absl::Status ParseTextProto(absl::string_view text,
                            google::protobuf::Message* proto) {
  FirstErrorCollector error_collector;
  google::protobuf::TextFormat::Parser parser;
  parser.RecordErrorsTo(&error_collector);
  if (!parser.ParseFromString(std::string(text), proto)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not parse ", proto->GetTypeName(), ": ",
                     error_collector.error()));
  }
  return absl::OkStatus();
}

absl::Status GetTextProto(absl::string_view file_name,
                          google::protobuf::Message* proto) {
  ASSIGN_OR_RETURN(const std::string contents, GetContents(file_name));
  RETURN_IF_ERROR(ParseTextProto(contents, proto)) << "in '" << file_name
                                                   << "'";
  VLOG(1) << "Read " << proto->GetTypeName() << " from '" << file_name << "'";
  return absl::OkStatus();
}

absl::Status SetTextProto(absl::string_view file_name,
                          const google::protobuf::Message& proto) {
  std::string proto_string;
  if (!google::protobuf::TextFormat::PrintToString(proto, &proto_string)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not print proto for '", file_name, "'."));
  }
  return SetContents(file_name, proto_string);
}

}  // namespace staffing::file
