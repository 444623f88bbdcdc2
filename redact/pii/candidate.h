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

#ifndef REDACT_PII_CANDIDATE_H_
#define REDACT_PII_CANDIDATE_H_

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "redact/base/types.h"
#include "redact/pii/entity-type.h"
#include "redact/util/unicode.h"

namespace redact {
namespace pii {

// Detector that produced a candidate.
enum Source {
  PATTERN,      // regex and context pattern detector
  NER,          // statistical named-entity tagger
  TRANSFORMER,  // transformer token classifier
  GENERATIVE,   // generative tagging model
  CONSENSUS,    // agreement between two detectors
};

// Number of candidate sources.
const int kNumSources = CONSENSUS + 1;

// Return the name of a candidate source, e.g. "PATTERN".
const char *SourceName(Source source);

// Parse candidate source name. Returns false if the name is unknown.
bool ParseSource(const string &name, Source *source);

// An entity candidate is one detector's proposal for a PII span. The span
// [begin, end[ is in Unicode code points of the source text. The text of the
// candidate is never stored; it is always sliced from the source text.
struct Candidate {
  Candidate() {}
  Candidate(int begin, int end, EntityType type, const string &raw_type,
            float score, Source source)
      : begin(begin), end(end), type(type), raw_type(raw_type),
        score(score), source(source) {}

  // Number of code points in span.
  int length() const { return end - begin; }

  // Check that the span is non-empty and inside a text of the given length,
  // and that the score is a finite number.
  bool Valid(int text_length) const {
    return begin >= 0 && begin < end && end <= text_length &&
           std::isfinite(score);
  }

  // Number of code points shared with another candidate.
  int Overlap(const Candidate &other) const {
    return std::max(0, std::min(end, other.end) -
                       std::max(begin, other.begin));
  }

  // Check if this candidate overlaps or is adjacent to another candidate.
  bool Touches(const Candidate &other) const {
    return begin <= other.end && other.begin <= end;
  }

  // Check if this candidate spans all of another candidate.
  bool Contains(const Candidate &other) const {
    return begin <= other.begin && other.end <= end;
  }

  int begin = 0;                  // first code point in span
  int end = 0;                    // end of span (exclusive)
  EntityType type = UNKNOWN;      // canonical entity type
  string raw_type;                // label reported by the detector
  float score = 0.0;              // detector confidence in [0;1]
  Source source = PATTERN;        // detector producing the candidate
  string partner_type;            // raw type of consensus partner
};

typedef std::vector<Candidate> Candidates;

// Input text for one reconciliation request. The text is decoded into code
// points once and all candidate offsets refer to these code points.
class SourceText {
 public:
  explicit SourceText(const string &utf8);

  // Original UTF-8 text.
  const string &utf8() const { return utf8_; }

  // Decoded code points.
  const ustring &codes() const { return codes_; }

  // Number of code points in text.
  int length() const { return codes_.size(); }

  // Return UTF-8 encoded text for code point range. The range is clipped to
  // the text.
  string Slice(int begin, int end) const;

  // Return text covered by candidate.
  string Text(const Candidate &candidate) const {
    return Slice(candidate.begin, candidate.end);
  }

 private:
  string utf8_;
  ustring codes_;
};

}  // namespace pii
}  // namespace redact

#endif  // REDACT_PII_CANDIDATE_H_
