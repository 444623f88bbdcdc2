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

#ifndef REDACT_PII_CONSENSUS_H_
#define REDACT_PII_CONSENSUS_H_

#include "redact/base/types.h"
#include "redact/pii/candidate.h"
#include "redact/pii/discard.h"

namespace redact {
namespace pii {

// Dual detection. A candidate is only trusted when two independent detectors
// agree on it. Two candidates agree when they have the same canonical type
// and their overlap is at least a fraction of the shorter span.
class ConsensusEngine {
 public:
  explicit ConsensusEngine(float threshold) : threshold_(threshold) {}

  // Check if two candidates agree.
  bool Agree(const Candidate &a, const Candidate &b) const;

  // Match candidates from the first detector against candidates from the
  // second detector. Each agreeing pair is output as one CONSENSUS candidate
  // covering both spans. Every candidate of the second detector is used at
  // most once. Candidates without agreement are reported and added to the
  // rejected candidates if these are requested.
  void Reconcile(const SourceText &text,
                 const Candidates &first, const Candidates &second,
                 Candidates *result, DiscardSink *sink,
                 Candidates *rejected = nullptr) const;

 private:
  // Determine why a candidate has no agreeing counterpart.
  DiscardReason RejectReason(const Candidate &candidate,
                             const Candidates &others) const;

  // Minimum overlap as a fraction of the shorter span.
  float threshold_;
};

}  // namespace pii
}  // namespace redact

#endif  // REDACT_PII_CONSENSUS_H_
