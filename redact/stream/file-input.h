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

#ifndef REDACT_STREAM_FILE_INPUT_H_
#define REDACT_STREAM_FILE_INPUT_H_

#include <string>
#include <vector>

#include "redact/base/macros.h"
#include "redact/base/status.h"
#include "redact/base/types.h"
#include "redact/stream/stream.h"

namespace redact {

// Input stream that runs a pipeline of input streams.
class InputPipeline : public InputStream {
 public:
  InputPipeline() {}
  ~InputPipeline() override;

  // Add input stream to pipeline. Takes ownership of the stream.
  void Add(InputStream *stream);

  // Implementation of InputStream interface.
  bool Next(const void **data, int *size) override;
  int64 ByteCount() const override;
  Status status() const override;

 private:
  // Final input stream.
  InputStream *last_ = nullptr;

  // Input stream pipeline.
  std::vector<InputStream *> streams_;
};

// File input with decompression of the input stream based on the file
// extension. Files ending in .gz are GZIP compressed and files ending in
// .bz2 are BZIP2 compressed.
class FileInput {
 public:
  // Open input file and add decompression for compressed input files. The
  // caller takes ownership of the returned stream.
  static Status Open(const string &filename, InputStream **stream,
                     int block_size = 1 << 20);

  // Read and decompress contents of file.
  static Status ReadContents(const string &filename, string *data,
                             int block_size = 1 << 20);

 private:
  DISALLOW_COPY_AND_ASSIGN(FileInput);
};

}  // namespace redact

#endif  // REDACT_STREAM_FILE_INPUT_H_
