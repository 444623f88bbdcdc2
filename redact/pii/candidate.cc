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

#include "redact/pii/candidate.h"

#include <algorithm>

namespace redact {
namespace pii {

static const char *kSourceNames[kNumSources] = {
  "PATTERN",
  "NER",
  "TRANSFORMER",
  "GENERATIVE",
  "CONSENSUS",
};

const char *SourceName(Source source) {
  if (source < 0 || source >= kNumSources) return "?";
  return kSourceNames[source];
}

bool ParseSource(const string &name, Source *source) {
  for (int i = 0; i < kNumSources; ++i) {
    if (name == kSourceNames[i]) {
      *source = static_cast<Source>(i);
      return true;
    }
  }
  return false;
}

SourceText::SourceText(const string &utf8) : utf8_(utf8) {
  UTF8::DecodeString(utf8_, &codes_);
}

string SourceText::Slice(int begin, int end) const {
  begin = std::max(begin, 0);
  end = std::min(end, length());
  string result;
  if (begin < end) UTF8::EncodeString(codes_, begin, end, &result);
  return result;
}

}  // namespace pii
}  // namespace redact
