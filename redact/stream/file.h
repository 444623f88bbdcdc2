// Copyright 2017 Google Inc.
//
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

#ifndef REDACT_STREAM_FILE_H_
#define REDACT_STREAM_FILE_H_

#include "redact/base/status.h"
#include "redact/base/types.h"
#include "redact/file/file.h"
#include "redact/stream/stream.h"

namespace redact {

// File-based input stream.
class FileInputStream : public InputStream {
 public:
  // Takes ownership of an open file.
  explicit FileInputStream(File *file, int block_size = 1 << 20);

  // Closes file.
  ~FileInputStream() override;

  // Implementation of InputStream interface.
  bool Next(const void **data, int *size) override;
  int64 ByteCount() const override { return position_; }
  Status status() const override { return status_; }

 private:
  File *file_;            // underlying file to read from
  uint8 *buffer_;         // file buffer
  int size_;              // size of file buffer
  int64 position_ = 0;    // current file position
  Status status_;         // read error
};

}  // namespace redact

#endif  // REDACT_STREAM_FILE_H_
