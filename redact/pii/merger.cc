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

#include "redact/pii/merger.h"

#include <algorithm>
#include <vector>

#include "redact/base/logging.h"

namespace redact {
namespace pii {

namespace {

// Order candidates by position with the highest scoring candidate first.
bool CandidateOrder(const Candidate &a, const Candidate &b) {
  if (a.begin != b.begin) return a.begin < b.begin;
  if (a.score != b.score) return a.score > b.score;
  if (a.end != b.end) return a.end > b.end;
  return a.type < b.type;
}

}  // namespace

void Merger::Merge(const SourceText &text, const Candidates &input,
                   Candidates *output, DiscardSink *sink) const {
  // Remove candidates outside the text.
  Candidates candidates;
  for (const Candidate &c : input) {
    if (c.Valid(text.length())) {
      candidates.push_back(c);
    } else {
      ReportDiscard(sink, MakeDiscard(INVALID_SPAN, NO_MATCH, text, c));
    }
  }
  std::stable_sort(candidates.begin(), candidates.end(), CandidateOrder);

  // Join overlapping and adjacent candidates of the same type.
  Candidates merged;
  int last[kNumEntityTypes];
  for (int t = 0; t < kNumEntityTypes; ++t) last[t] = -1;
  for (const Candidate &c : candidates) {
    int prev = last[c.type];
    if (prev != -1 && merged[prev].Touches(c)) {
      Candidate &m = merged[prev];
      m.end = std::max(m.end, c.end);
      m.score = std::max(m.score, c.score);
    } else {
      last[c.type] = merged.size();
      merged.push_back(c);
    }
  }

  // Remove candidates contained in a candidate of a higher priority type.
  std::vector<bool> dropped(merged.size());
  for (int i = 0; i < merged.size(); ++i) {
    for (int j = 0; j < merged.size(); ++j) {
      if (i == j) continue;
      const Candidate &outer = merged[i];
      const Candidate &inner = merged[j];
      if (outer.type == inner.type || !outer.Contains(inner)) continue;
      int outer_rank = config_->rank(outer.type);
      int inner_rank = config_->rank(inner.type);
      if (outer_rank < inner_rank) {
        dropped[j] = true;
      } else if (inner_rank < outer_rank) {
        dropped[i] = true;
      }
    }
  }

  output->clear();
  for (int i = 0; i < merged.size(); ++i) {
    if (dropped[i]) {
      VLOG(1) << "Drop contained " << EntityTypeName(merged[i].type)
              << " [" << merged[i].begin << "," << merged[i].end << "[";
      continue;
    }
    output->push_back(merged[i]);
  }
  std::stable_sort(output->begin(), output->end(), CandidateOrder);
}

}  // namespace pii
}  // namespace redact
