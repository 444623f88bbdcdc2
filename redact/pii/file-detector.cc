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

#include "redact/pii/file-detector.h"

#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <cmath>

#include "redact/base/logging.h"
#include "redact/stream/file-input.h"

namespace redact {
namespace pii {

namespace {

// Split string on tabs.
std::vector<string> SplitFields(const string &line) {
  std::vector<string> fields;
  size_t pos = 0;
  for (;;) {
    size_t tab = line.find('\t', pos);
    if (tab == string::npos) {
      fields.push_back(line.substr(pos));
      break;
    }
    fields.push_back(line.substr(pos, tab - pos));
    pos = tab + 1;
  }
  return fields;
}

// Parse decimal integer field.
bool ParseInt(const string &str, int *value) {
  if (str.empty()) return false;
  char *end;
  errno = 0;
  long n = strtol(str.c_str(), &end, 10);
  if (*end != 0 || errno == ERANGE) return false;
  if (n < INT_MIN || n > INT_MAX) return false;
  *value = n;
  return true;
}

// Parse floating point field.
bool ParseFloat(const string &str, float *value) {
  if (str.empty()) return false;
  char *end;
  *value = strtof(str.c_str(), &end);
  return *end == 0 && std::isfinite(*value);
}

}  // namespace

Status ParseLabelledSpan(const string &line, LabelledToken *span) {
  std::vector<string> fields = SplitFields(line);
  if (fields.size() < 3 || fields.size() > 4) {
    return Status(E_PARSE, "expected 3 or 4 fields", line);
  }
  if (!ParseInt(fields[0], &span->begin) || !ParseInt(fields[1], &span->end)) {
    return Status(E_PARSE, "invalid offsets", line);
  }
  span->label = fields[2];
  span->score = 1.0;
  if (fields.size() == 4 && !ParseFloat(fields[3], &span->score)) {
    return Status(E_PARSE, "invalid score", line);
  }
  return Status::OK;
}

Status ParseLabelledSpans(const string &filename, const string &contents,
                          std::vector<LabelledToken> *spans) {
  size_t pos = 0;
  int lineno = 0;
  while (pos < contents.size()) {
    size_t eol = contents.find('\n', pos);
    if (eol == string::npos) eol = contents.size();
    string line = contents.substr(pos, eol - pos);
    pos = eol + 1;
    lineno++;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty() || line[0] == '#') continue;

    LabelledToken span;
    Status st = ParseLabelledSpan(line, &span);
    if (!st.ok()) {
      return Status(st.code(), filename + ":" + std::to_string(lineno),
                    st.message());
    }
    spans->push_back(span);
  }
  return Status::OK;
}

string SpanFileDetector::name() const {
  return string(SourceName(source_)) + ":" + filename_;
}

Status SpanFileDetector::Load() {
  string contents;
  Status st = FileInput::ReadContents(filename_, &contents);
  if (!st.ok()) return st;
  spans_.clear();
  st = ParseLabelledSpans(filename_, contents, &spans_);
  if (!st.ok()) return st;
  ready_ = true;
  return Status::OK;
}

Status SpanFileDetector::Detect(const SourceText &text,
                                DetectorOutputs *outputs) const {
  if (!ready_) return Status(E_UNAVAILABLE, name(), "not loaded");
  for (const LabelledToken &span : spans_) {
    outputs->candidates.emplace_back(span.begin, span.end, UNKNOWN,
                                     span.label, span.score, source_);
  }
  return Status::OK;
}

string TokenFileDetector::name() const {
  return string(SourceName(source_)) + " tokens:" + filename_;
}

Status TokenFileDetector::Load() {
  string contents;
  Status st = FileInput::ReadContents(filename_, &contents);
  if (!st.ok()) return st;
  tokens_.clear();
  st = ParseLabelledSpans(filename_, contents, &tokens_);
  if (!st.ok()) return st;
  ready_ = true;
  return Status::OK;
}

Status TokenFileDetector::Detect(const SourceText &text,
                                 DetectorOutputs *outputs) const {
  if (!ready_) return Status(E_UNAVAILABLE, name(), "not loaded");
  decoder_.Decode(tokens_, &outputs->candidates);
  return Status::OK;
}

string GenerationFileDetector::name() const {
  return "GENERATIVE:" + filename_;
}

Status GenerationFileDetector::Load() {
  Status st = FileInput::ReadContents(filename_, &generation_);
  if (!st.ok()) return st;
  ready_ = true;
  return Status::OK;
}

Status GenerationFileDetector::Detect(const SourceText &text,
                                      DetectorOutputs *outputs) const {
  if (!ready_) return Status(E_UNAVAILABLE, name(), "not loaded");
  parser_->Parse(generation_, &outputs->tagged);
  return Status::OK;
}

}  // namespace pii
}  // namespace redact
