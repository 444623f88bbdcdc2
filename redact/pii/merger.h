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

#ifndef REDACT_PII_MERGER_H_
#define REDACT_PII_MERGER_H_

#include "redact/base/types.h"
#include "redact/pii/candidate.h"
#include "redact/pii/config.h"
#include "redact/pii/discard.h"

namespace redact {
namespace pii {

// Merges overlapping candidates into a set of entities where no two entities
// of the same type overlap or touch. Overlapping and adjacent candidates of
// the same type are joined. When a candidate lies completely inside a
// candidate of another type, the one with the lower type priority is
// removed. Partial overlaps between types are kept. Merging the output again
// does not change it.
class Merger {
 public:
  explicit Merger(const ReconcilerConfig *config) : config_(config) {}

  // Merge candidates. Candidates with invalid spans are dropped and reported.
  // The output is sorted by position.
  void Merge(const SourceText &text, const Candidates &input,
             Candidates *output, DiscardSink *sink) const;

 private:
  const ReconcilerConfig *config_;
};

}  // namespace pii
}  // namespace redact

#endif  // REDACT_PII_MERGER_H_
