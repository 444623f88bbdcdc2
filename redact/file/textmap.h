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

#ifndef REDACT_FILE_TEXTMAP_H_
#define REDACT_FILE_TEXTMAP_H_

#include <string>
#include <vector>

#include "redact/base/status.h"
#include "redact/base/types.h"
#include "redact/file/file.h"

namespace redact {

// A text map file is a text file with one entry per line. The key and
// value are separated by a tab character. Empty lines and lines starting
// with '#' are skipped.
class TextMapInput {
 public:
  TextMapInput(const std::vector<string> &filenames, int buffer_size = 1 << 16);
  TextMapInput(const string &filename) : TextMapInput({filename}, 1 << 16) {}
  ~TextMapInput();

  // Read next entry from file. Return false if there are no more entries or
  // if a file could not be read. Check status() to tell the two apart.
  bool Next();

  // Return current entry id.
  int id() const { return id_; }

  // Return line number of the current entry in the current file.
  int line() const { return line_; }

  // Return current file name.
  const string &filename() const { return filenames_[current_file_]; }

  // Return current key and value.
  const string &key() const { return key_; }
  const string &value() const { return value_; }

  // Return the status of the input. This is not ok if a file could not be
  // opened or read.
  const Status &status() const { return status_; }

 private:
  // Get next character from input. Returns -1 on end of current file.
  int NextChar() {
    if (next_ < end_) {
      return static_cast<uint8>(*next_++);
    } else {
      return Fill();
    }
  }

  // Fill buffer and return first character or -1 if end of current file.
  int Fill();

  // Read the next raw line into key and value. Return false at end of file.
  bool ReadLine();

  // Current file.
  File *file_ = nullptr;

  // Input files.
  std::vector<string> filenames_;

  // Current file number.
  int current_file_ = 0;

  // Input buffer.
  int buffer_size_;
  char *buffer_;
  char *next_;
  char *end_;

  // Current entry. First entry is zero.
  int id_ = -1;

  // Current line number in the current file. First line is one.
  int line_ = 0;

  // Current key and value.
  string key_;
  string value_;

  // Input status.
  Status status_;
};

}  // namespace redact

#endif  // REDACT_FILE_TEXTMAP_H_
