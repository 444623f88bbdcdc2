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

#include "redact/stream/bzip2.h"

#include <string.h>
#include <string>

#include "redact/base/logging.h"

namespace redact {

BZip2Decompressor::BZip2Decompressor(InputStream *source, int block_size)
    : source_(source), block_size_(block_size) {
  memset(&stream_, 0, sizeof(stream_));
  CHECK(BZ2_bzDecompressInit(&stream_, 0, 0) == BZ_OK);
  buffer_ = new char[block_size_];
}

BZip2Decompressor::~BZip2Decompressor() {
  CHECK(BZ2_bzDecompressEnd(&stream_) == BZ_OK);
  delete [] buffer_;
}

bool BZip2Decompressor::Next(const void **data, int *size) {
  if (!status_.ok()) return false;

  // Read next chunk from source.
  while (stream_.avail_in == 0) {
    const void *chunk;
    int bytes;
    if (!source_->Next(&chunk, &bytes)) {
      status_ = source_->status();
      if (status_.ok() && pending_) {
        status_ = Status(E_IO, "BZIP2 input error", "truncated stream");
      }
      return false;
    }
    stream_.next_in = static_cast<char *>(const_cast<void *>(chunk));
    stream_.avail_in = bytes;
  }

  // Check for reset.
  if (reset_) {
    // Keep the remaining input chunk.
    char *next = stream_.next_in;
    int avail = stream_.avail_in;

    // Reset decompressor.
    CHECK(BZ2_bzDecompressEnd(&stream_) == BZ_OK);
    CHECK(BZ2_bzDecompressInit(&stream_, 0, 0) == BZ_OK);

    // Initialize decompressor with remaining input chunk.
    stream_.next_in = next;
    stream_.avail_in = avail;
    reset_ = false;
  }

  // Decompress chunk.
  stream_.next_out = buffer_;
  stream_.avail_out = block_size_;
  pending_ = true;
  int rc = BZ2_bzDecompress(&stream_);
  if (rc == BZ_STREAM_END) {
    reset_ = true;
    pending_ = false;
  } else if (rc != BZ_OK) {
    status_ = Status(E_IO, "Corrupt BZIP2 input, error",
                     std::to_string(rc));
    return false;
  }

  // Return uncompressed data.
  int uncompressed = stream_.next_out - buffer_;
  *data = buffer_;
  *size = uncompressed;
  total_bytes_ += uncompressed;
  return true;
}

}  // namespace redact
