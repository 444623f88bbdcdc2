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

#include "redact/pii/allow-list.h"

#include <ctype.h>
#include <algorithm>
#include <vector>

#include "redact/base/logging.h"
#include "redact/base/types.h"
#include "redact/stream/file-input.h"
#include "redact/util/unicode.h"

namespace redact {
namespace pii {

namespace {

// Remove ASCII whitespace from both ends of string.
string Strip(const string &str) {
  int begin = 0;
  int end = str.size();
  while (begin < end && isspace(static_cast<uint8>(str[begin]))) begin++;
  while (end > begin && isspace(static_cast<uint8>(str[end - 1]))) end--;
  return str.substr(begin, end - begin);
}

// Extract the '|'-separated terms of a suffix like "/alias[a|b]".
void ExtractSuffixTerms(const string &line, const string &suffix,
                        std::vector<string> *terms) {
  size_t start = line.find(suffix);
  if (start == string::npos) return;
  start += suffix.size();
  size_t end = line.find(']', start);
  if (end == string::npos) return;
  string list = line.substr(start, end - start);
  size_t pos = 0;
  while (pos <= list.size()) {
    size_t bar = list.find('|', pos);
    if (bar == string::npos) bar = list.size();
    string term = Strip(list.substr(pos, bar - pos));
    if (!term.empty()) terms->push_back(term);
    pos = bar + 1;
  }
}

}  // namespace

string AllowList::Normalize(const string &term) {
  string normalized;
  UTF8::Normalize(term, NORMALIZE_CASE | NORMALIZE_WHITESPACE, &normalized);
  return normalized;
}

void AllowList::Add(const string &term) {
  if (term.empty()) return;
  terms_.insert(term);
  string normalized = Normalize(term);
  if (!normalized.empty()) normalized_.insert(normalized);
}

int AllowList::AddDictionary(const string &contents) {
  int count = 0;
  size_t pos = 0;
  while (pos < contents.size()) {
    size_t eol = contents.find('\n', pos);
    if (eol == string::npos) eol = contents.size();
    string line = Strip(contents.substr(pos, eol - pos));
    pos = eol + 1;
    if (line.empty() || line[0] == '#') continue;

    // The main term comes before any suffix.
    std::vector<string> terms;
    size_t suffix = std::min(line.find("/alias["), line.find("/js["));
    string main = Strip(line.substr(0, suffix));
    if (!main.empty()) terms.push_back(main);
    ExtractSuffixTerms(line, "/alias[", &terms);
    ExtractSuffixTerms(line, "/js[", &terms);

    for (const string &term : terms) Add(term);
    count += terms.size();
  }
  return count;
}

Status AllowList::LoadDictionary(const string &filename) {
  string contents;
  Status st = FileInput::ReadContents(filename, &contents);
  if (!st.ok()) return st;
  int count = AddDictionary(contents);
  VLOG(1) << "Loaded " << count << " allowed terms from " << filename;
  return Status::OK;
}

bool AllowList::Contains(const string &text) const {
  if (terms_.empty()) return false;
  if (terms_.count(text) > 0) return true;
  string normalized = Normalize(text);
  if (normalized.empty()) return false;
  return normalized_.count(normalized) > 0;
}

}  // namespace pii
}  // namespace redact
