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

#include "redact/file/file.h"

#include <string>

#include "redact/base/logging.h"
#include "redact/base/status.h"
#include "redact/base/types.h"

namespace redact {

Status File::WriteContents(const string &filename,
                           const void *data,
                           size_t size) {
  // Open file for writing.
  File *f;
  Status st = Open(filename, "w", &f);
  if (!st.ok()) return st;

  // Write contents.
  st = f->Write(data, size);
  if (!st.ok()) {
    Status close = f->Close();
    if (!close.ok()) LOG(WARNING) << filename << ": " << close;
    return st;
  }

  // Close file.
  return f->Close();
}

}  // namespace redact
