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

#include "redact/pii/noise-filter.h"

namespace redact {
namespace pii {

bool NoiseFilter::IsNoise(const ustring &codes, int begin, int end) const {
  if (begin >= end) return true;
  int words = 0;
  int content = 0;
  for (int i = begin; i < end; ++i) {
    int c = codes[i];
    if (Unicode::IsWord(c)) words++;
    if (!Unicode::IsWhitespace(c) && !Unicode::IsSpace(c) &&
        !Unicode::IsPunctuation(c)) {
      content++;
    }
  }
  if (words == 0) return true;
  return content < min_content_ratio_ * (end - begin);
}

void NoiseFilter::Filter(const SourceText &text, Candidates *candidates,
                         DiscardSink *sink) const {
  int kept = 0;
  for (int i = 0; i < candidates->size(); ++i) {
    const Candidate &c = (*candidates)[i];
    if (IsNoise(text.codes(), c.begin, c.end)) {
      ReportDiscard(sink, MakeDiscard(NOISE_REJECT, NOISE_CONTENT, text, c));
    } else {
      if (kept != i) (*candidates)[kept] = c;
      kept++;
    }
  }
  candidates->resize(kept);
}

}  // namespace pii
}  // namespace redact
