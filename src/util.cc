// Copyright 2022 Ola Rozenfeld
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
#include "src/util.h"

#include <fcntl.h>
#include <unistd.h>

#ifdef _WIN32
#include <io.h>
#endif

#include "absl/strings/str_cat.h"
#include "ortools/base/logging.h"
#include "google/protobuf/io/zero_copy_stream_impl.h"
#include "google/protobuf/text_format.h"

namespace clue {
using google::protobuf::io::FileInputStream;
using google::protobuf::io::FileOutputStream;
using google::protobuf::TextFormat;

absl::Status ParseProtoFromFile(const path& filename, Message* msg) {
  int ff = open(filename.string().c_str(), O_RDONLY);
  if (ff < 0) {
    return absl::NotFoundError(
        absl::StrCat("Failed opening file: ", filename.string()));
  }
  FileInputStream fstream(ff);
  const bool parsed = TextFormat::Parse(&fstream, msg);
  close(ff);
  if (!parsed) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Failed parsing ", msg->GetTypeName(), " from ", filename.string()));
  }
  return absl::OkStatus();
}

void WriteProtoToFile(const Message& msg, const path& filename) {
  int ff = open(filename.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  CHECK_GE(ff, 0) << "Failed opening file: " << filename;
  {
    FileOutputStream output(ff);
    CHECK(TextFormat::Print(msg, &output))
        << "Failed writing proto to " << filename;
    CHECK(output.Flush()) << "Failed writing proto to " << filename;
  }
  close(ff);
}

}  // namespace clue
