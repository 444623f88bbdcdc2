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

#include "redact/stream/file.h"

#include "redact/base/logging.h"

namespace redact {

FileInputStream::FileInputStream(File *file, int block_size)
    : file_(file), size_(block_size) {
  CHECK_GT(block_size, 0);
  buffer_ = new uint8[size_];
}

FileInputStream::~FileInputStream() {
  Status st = file_->Close();
  if (!st.ok()) LOG(WARNING) << "Error closing input file: " << st;
  delete [] buffer_;
}

bool FileInputStream::Next(const void **data, int *size) {
  if (!status_.ok()) return false;

  // Read data into buffer.
  uint64 bytes;
  status_ = file_->Read(buffer_, size_, &bytes);
  if (!status_.ok() || bytes == 0) return false;
  position_ += bytes;

  // Return buffer read from file.
  *data = buffer_;
  *size = bytes;
  return true;
}

}  // namespace redact
