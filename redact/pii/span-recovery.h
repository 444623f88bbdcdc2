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

#ifndef REDACT_PII_SPAN_RECOVERY_H_
#define REDACT_PII_SPAN_RECOVERY_H_

#include <vector>

#include "redact/base/types.h"
#include "redact/pii/candidate.h"
#include "redact/pii/config.h"
#include "redact/pii/discard.h"
#include "redact/pii/generation-parser.h"

namespace redact {
namespace pii {

// Result of locating one tagged value in the source text.
struct RecoveryOutcome {
  bool recovered = false;       // true if the value was placed
  int begin = -1;               // recovered span
  int end = -1;
  EntityType type = UNKNOWN;    // canonical type of the tag
  DiscardReason reason = NO_MATCH;  // reason when not recovered
};

// Recovers the source text offsets of values tagged by the generative model.
// Values are placed left to right in generation order. Each recovered value
// moves a consumption pointer past its span, and later values are only
// searched after the pointer. A value is placed by exact search, then by
// search in normalized text, and finally by using the generation context as
// anchors around a text window. Uncertain placements are discarded.
class SpanRecovery {
 public:
  explicit SpanRecovery(const ReconcilerConfig *config) : config_(config) {}

  // Locate tagged value in the text after the consumption pointer.
  RecoveryOutcome Recover(const SourceText &text, const TaggedValue &value,
                          int pointer) const;

  // Recover all tagged values and append GENERATIVE candidates. Values that
  // cannot be placed are reported to the discard sink.
  void RecoverAll(const SourceText &text,
                  const std::vector<TaggedValue> &values,
                  Candidates *candidates, DiscardSink *sink) const;

 private:
  // Find a text window between the context anchors of the value and check
  // that exactly one acceptable window exists.
  void RecoverFromAnchors(const SourceText &text, const TaggedValue &value,
                          int value_length, int pointer,
                          RecoveryOutcome *outcome) const;

  const ReconcilerConfig *config_;
};

}  // namespace pii
}  // namespace redact

#endif  // REDACT_PII_SPAN_RECOVERY_H_
