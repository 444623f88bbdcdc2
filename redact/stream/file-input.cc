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

#include "redact/stream/file-input.h"

#include <string>
#include <vector>

#include "redact/file/file.h"
#include "redact/stream/bzip2.h"
#include "redact/stream/file.h"
#include "redact/stream/gzip.h"

namespace redact {

InputPipeline::~InputPipeline() {
  // Delete streams.
  for (int i = streams_.size() - 1; i >= 0; --i) {
    delete streams_[i];
  }
}

void InputPipeline::Add(InputStream *stream) {
  streams_.push_back(stream);
  last_ = stream;
}

bool InputPipeline::Next(const void **data, int *size) {
  return last_->Next(data, size);
}

int64 InputPipeline::ByteCount() const {
  return last_->ByteCount();
}

Status InputPipeline::status() const {
  return last_->status();
}

Status FileInput::Open(const string &filename, InputStream **stream,
                       int block_size) {
  // Open input file.
  File *file;
  Status st = File::Open(filename, "r", &file);
  if (!st.ok()) return st;
  InputStream *input = new FileInputStream(file, block_size);

  // Get file extension.
  int dot = filename.find_last_of('.');
  if (dot != -1) {
    string ext = filename.substr(dot);
    InputStream *decompressor = nullptr;
    if (ext == ".gz") {
      // Add GZIP decompressor.
      decompressor = new GZipDecompressor(input, block_size);
    } else if (ext == ".bz2") {
      // Add BZIP2 decompressor.
      decompressor = new BZip2Decompressor(input, block_size);
    }

    // Create input pipeline for compressed files.
    if (decompressor != nullptr) {
      InputPipeline *pipeline = new InputPipeline();
      pipeline->Add(input);
      pipeline->Add(decompressor);
      input = pipeline;
    }
  }

  *stream = input;
  return Status::OK;
}

Status FileInput::ReadContents(const string &filename, string *data,
                               int block_size) {
  InputStream *stream;
  Status st = Open(filename, &stream, block_size);
  if (!st.ok()) return st;

  data->clear();
  const void *chunk;
  int size;
  while (stream->Next(&chunk, &size)) {
    data->append(static_cast<const char *>(chunk), size);
  }
  st = stream->status();
  delete stream;
  if (!st.ok()) return Status(st.code(), filename, st.message());
  return Status::OK;
}

}  // namespace redact
