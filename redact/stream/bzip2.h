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

#ifndef REDACT_STREAM_BZIP2_H_
#define REDACT_STREAM_BZIP2_H_

#include <bzlib.h>

#include "redact/base/status.h"
#include "redact/base/types.h"
#include "redact/stream/stream.h"

namespace redact {

// BZIP2 stream decompression.
class BZip2Decompressor : public InputStream {
 public:
  // Initialize decompressor.
  BZip2Decompressor(InputStream *source,
                    int block_size = 1 << 20);
  ~BZip2Decompressor() override;

  // Implementation of InputStream interface.
  bool Next(const void **data, int *size) override;
  int64 ByteCount() const override { return total_bytes_; }
  Status status() const override { return status_; }

 private:
  // Source for compressed input.
  InputStream *source_;

  // Decompression buffer.
  char *buffer_;
  int block_size_;

  // Decompressor.
  bz_stream stream_;

  // Number of bytes uncompressed.
  uint64 total_bytes_ = 0;

  // Reset decompressor on next chunk (for multi stream bzip2 files).
  bool reset_ = false;

  // Decompressor is inside a compressed stream.
  bool pending_ = false;

  // Input error.
  Status status_;
};

}  // namespace redact

#endif  // REDACT_STREAM_BZIP2_H_
