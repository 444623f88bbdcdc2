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

#include "redact/file/textmap.h"

#include <stdlib.h>

#include "redact/base/logging.h"
#include "redact/base/status.h"
#include "redact/base/types.h"
#include "redact/file/file.h"

namespace redact {

TextMapInput::TextMapInput(const std::vector<string> &filenames,
                           int buffer_size)
    : filenames_(filenames), buffer_size_(buffer_size) {
  // Allocate input buffer.
  buffer_ = static_cast<char *>(malloc(buffer_size));
  next_ = end_ = buffer_;
}

TextMapInput::~TextMapInput() {
  // Deallocate input buffer.
  free(buffer_);

  // Close current input file.
  if (file_ != nullptr) {
    Status st = file_->Close();
    if (!st.ok()) LOG(WARNING) << "Error closing text map: " << st;
  }
}

bool TextMapInput::ReadLine() {
  key_.clear();
  value_.clear();

  // Read key.
  int c;
  while ((c = NextChar()) != -1) {
    if (c == '\t' || c == '\n') break;
    key_.push_back(c);
  }

  // Read value.
  if (c == '\t') {
    while ((c = NextChar()) != -1) {
      if (c == '\n') break;
      value_.push_back(c);
    }
  }

  // Remove carriage return from files with DOS line endings.
  string &last = value_.empty() ? key_ : value_;
  if (!last.empty() && last.back() == '\r') last.pop_back();

  return c != -1 || !key_.empty() || !value_.empty();
}

bool TextMapInput::Next() {
  while (status_.ok() && current_file_ < filenames_.size()) {
    if (file_ != nullptr) {
      bool more = ReadLine();
      if (!status_.ok()) return false;
      if (!more) {
        // No more lines in file. Switch to next file.
        Status st = file_->Close();
        file_ = nullptr;
        if (!st.ok()) {
          status_ = st;
          return false;
        }
        current_file_++;
        continue;
      }
      line_++;

      // Skip empty lines and comments.
      if (key_.empty() && value_.empty()) continue;
      if (!key_.empty() && key_[0] == '#') continue;

      // Return next entry.
      id_++;
      return true;
    } else {
      // Open the next file.
      Status st = File::Open(filenames_[current_file_], "r", &file_);
      if (!st.ok()) {
        file_ = nullptr;
        status_ = st;
        return false;
      }
      next_ = end_ = buffer_;
      line_ = 0;
    }
  }

  // No more entries.
  return false;
}

int TextMapInput::Fill() {
  DCHECK(next_ == end_);
  DCHECK(file_ != nullptr);
  uint64 bytes;
  Status st = file_->Read(buffer_, buffer_size_, &bytes);
  if (!st.ok()) {
    status_ = st;
    return -1;
  }
  if (bytes == 0) return -1;
  next_ = buffer_;
  end_ = buffer_ + bytes;
  return static_cast<uint8>(*next_++);
}

}  // namespace redact
