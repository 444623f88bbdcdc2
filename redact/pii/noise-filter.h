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

#ifndef REDACT_PII_NOISE_FILTER_H_
#define REDACT_PII_NOISE_FILTER_H_

#include "redact/base/types.h"
#include "redact/pii/candidate.h"
#include "redact/pii/discard.h"
#include "redact/util/unicode.h"

namespace redact {
namespace pii {

// Removes candidates with degenerate text, e.g. a run of symbols and line
// breaks tagged as a person name. A span needs at least one letter or number
// and a minimum fraction of characters that are neither whitespace nor
// punctuation.
class NoiseFilter {
 public:
  explicit NoiseFilter(float min_content_ratio)
      : min_content_ratio_(min_content_ratio) {}

  // Check if the code points in [begin;end[ are noise.
  bool IsNoise(const ustring &codes, int begin, int end) const;

  // Remove noise candidates and report them to the sink.
  void Filter(const SourceText &text, Candidates *candidates,
              DiscardSink *sink) const;

 private:
  float min_content_ratio_;
};

}  // namespace pii
}  // namespace redact

#endif  // REDACT_PII_NOISE_FILTER_H_
