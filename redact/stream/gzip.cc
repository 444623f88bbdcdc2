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

#include "redact/stream/gzip.h"

#include <string.h>
#include <string>

#include "redact/base/logging.h"

namespace redact {

GZipDecompressor::GZipDecompressor(InputStream *source,
                                   int block_size,
                                   int window_bits)
    : source_(source), block_size_(block_size) {
  memset(&stream_, 0, sizeof(stream_));
  CHECK(inflateInit2(&stream_, window_bits) == Z_OK);
  buffer_ = new char[block_size_];
}

GZipDecompressor::~GZipDecompressor() {
  CHECK(inflateEnd(&stream_) == Z_OK);
  delete [] buffer_;
}

bool GZipDecompressor::Next(const void **data, int *size) {
  if (!status_.ok()) return false;

  // Read next chunk from source.
  while (stream_.avail_in == 0) {
    const void *chunk;
    int bytes;
    if (!source_->Next(&chunk, &bytes)) {
      status_ = source_->status();
      if (status_.ok() && pending_) {
        status_ = Status(E_IO, "GZIP input error", "truncated stream");
      }
      return false;
    }
    stream_.next_in = static_cast<Bytef *>(const_cast<void *>(chunk));
    stream_.avail_in = bytes;
  }

  // Check for reset.
  if (reset_) {
    // Keep the remaining input chunk.
    Bytef *next = stream_.next_in;
    int avail = stream_.avail_in;

    // Reset decompressor.
    CHECK(inflateReset(&stream_) == Z_OK);

    // Initialize decompressor with remaining input chunk.
    stream_.next_in = next;
    stream_.avail_in = avail;
    reset_ = false;
  }

  // Decompress chunk.
  stream_.next_out = reinterpret_cast<Bytef *>(buffer_);
  stream_.avail_out = block_size_;
  pending_ = true;
  int rc = inflate(&stream_, Z_NO_FLUSH);
  if (rc == Z_STREAM_END) {
    reset_ = true;
    pending_ = false;
  } else if (rc != Z_OK) {
    string error = stream_.msg != nullptr ? stream_.msg : std::to_string(rc);
    status_ = Status(E_IO, "GZIP input error", error);
    return false;
  }

  // Return uncompressed data.
  int uncompressed = reinterpret_cast<char *>(stream_.next_out) - buffer_;
  *data = buffer_;
  *size = uncompressed;
  total_bytes_ += uncompressed;
  return true;
}

}  // namespace redact
