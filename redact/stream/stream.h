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

// This file contains the InputStream interface for reading data in chunks.
// Ownership of the chunk buffers stays with the stream, so a stream can
// return data straight from its internal buffers without copying it into a
// buffer supplied by the caller:
//
//   const void *buffer;
//   int size;
//   while (input->Next(&buffer, &size)) DoSomething(buffer, size);
//   if (!input->status().ok()) ...

#ifndef REDACT_STREAM_STREAM_H_
#define REDACT_STREAM_STREAM_H_

#include "redact/base/macros.h"
#include "redact/base/status.h"
#include "redact/base/types.h"

namespace redact {

// Abstract input stream interface designed to minimize copying.
class InputStream {
 public:
  InputStream() {}
  virtual ~InputStream() = default;

  // Obtains a chunk of data from the stream.
  //
  // Preconditions:
  // * "size" and "data" are not null.
  //
  // Postconditions:
  // * If the returned value is false, there is no more data to return or
  //   an error occurred. All errors are permanent and reported by status().
  // * Otherwise, "size" points to the actual number of bytes read and "data"
  //   points to a pointer to a buffer containing these bytes.
  // * Ownership of this buffer remains with the stream, and the buffer
  //   remains valid only until some other method of the stream is called
  //   or the stream is destroyed.
  // * It is legal for the returned buffer to have zero size, as long
  //   as repeatedly calling Next() eventually yields a buffer with non-zero
  //   size.
  virtual bool Next(const void **data, int *size) = 0;

  // Returns the total number of bytes read since this object was created.
  virtual int64 ByteCount() const = 0;

  // Returns the error that ended the stream, or OK.
  virtual Status status() const = 0;

 private:
  DISALLOW_COPY_AND_ASSIGN(InputStream);
};

}  // namespace redact

#endif  // REDACT_STREAM_STREAM_H_
