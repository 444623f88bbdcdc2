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

#ifndef REDACT_FILE_FILE_H_
#define REDACT_FILE_FILE_H_

#include <string>

#include "redact/base/logging.h"
#include "redact/base/status.h"
#include "redact/base/types.h"

namespace redact {

// Abstract file interface.
class File {
 protected:
  // Use Close() to close and delete the file object.
  virtual ~File() = default;

 public:
  // Read up to "size" bytes from the file at the current position.
  virtual Status Read(void *buffer, size_t size, uint64 *read) = 0;

  // Write data to the file at the current position.
  virtual Status Write(const void *buffer, size_t size) = 0;

  // Close the file and delete the file object.
  virtual Status Close() = 0;

  // Return the file name.
  virtual string filename() const = 0;

  // Open file. Modes are "r", "r+", "w", "w+", "a", and "a+".
  static Status Open(const string &name, const char *mode, File **f);

  // Delete a file.
  static Status Delete(const string &name);

  // Write contents of file.
  static Status WriteContents(const string &filename,
                              const void *data, size_t size);
  static Status WriteContents(const string &filename, const string &data) {
    return WriteContents(filename, data.data(), data.size());
  }
};

}  // namespace redact

#endif  // REDACT_FILE_FILE_H_
