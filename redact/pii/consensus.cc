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

#include "redact/pii/consensus.h"

#include <algorithm>
#include <vector>

#include "redact/base/logging.h"

namespace redact {
namespace pii {

bool ConsensusEngine::Agree(const Candidate &a, const Candidate &b) const {
  if (a.type != b.type) return false;
  int overlap = a.Overlap(b);
  if (overlap == 0) return false;
  return overlap >= threshold_ * std::min(a.length(), b.length());
}

void ConsensusEngine::Reconcile(const SourceText &text,
                                const Candidates &first,
                                const Candidates &second,
                                Candidates *result,
                                DiscardSink *sink,
                                Candidates *rejected) const {
  std::vector<bool> used(second.size());
  std::vector<bool> matched(first.size());
  for (int i = 0; i < first.size(); ++i) {
    const Candidate &a = first[i];

    // Select the best agreeing candidate by score, overlap, and position.
    int best = -1;
    for (int j = 0; j < second.size(); ++j) {
      if (used[j]) continue;
      const Candidate &b = second[j];
      if (!Agree(a, b)) continue;
      if (best != -1) {
        const Candidate &current = second[best];
        if (b.score < current.score) continue;
        if (b.score == current.score) {
          int overlap = a.Overlap(b);
          int current_overlap = a.Overlap(current);
          if (overlap < current_overlap) continue;
          if (overlap == current_overlap && b.begin >= current.begin) continue;
        }
      }
      best = j;
    }
    if (best == -1) continue;

    // Output consensus candidate covering both spans.
    const Candidate &b = second[best];
    Candidate consensus(std::min(a.begin, b.begin), std::max(a.end, b.end),
                        a.type, a.raw_type, std::max(a.score, b.score),
                        CONSENSUS);
    consensus.partner_type = b.raw_type;
    VLOG(2) << "Consensus " << EntityTypeName(a.type) << " "
            << a.raw_type << "/" << b.raw_type
            << " [" << consensus.begin << "," << consensus.end << "[";
    result->push_back(consensus);
    used[best] = true;
    matched[i] = true;
  }

  // Report candidates without agreement.
  for (int i = 0; i < first.size(); ++i) {
    if (matched[i]) continue;
    DiscardReason reason = RejectReason(first[i], second);
    ReportDiscard(sink, MakeDiscard(CONSENSUS_REJECT, reason, text, first[i]));
    if (rejected != nullptr) rejected->push_back(first[i]);
  }
  for (int j = 0; j < second.size(); ++j) {
    if (used[j]) continue;
    DiscardReason reason = RejectReason(second[j], first);
    ReportDiscard(sink, MakeDiscard(CONSENSUS_REJECT, reason, text, second[j]));
    if (rejected != nullptr) rejected->push_back(second[j]);
  }
}

DiscardReason ConsensusEngine::RejectReason(const Candidate &candidate,
                                            const Candidates &others) const {
  bool same_type = false;
  bool other_type = false;
  for (const Candidate &other : others) {
    if (candidate.Overlap(other) == 0) continue;
    if (other.type == candidate.type) {
      same_type = true;
    } else {
      other_type = true;
    }
  }
  if (same_type) return INSUFFICIENT_OVERLAP;
  if (other_type) return TYPE_MISMATCH;
  return NO_COUNTERPART;
}

}  // namespace pii
}  // namespace redact
