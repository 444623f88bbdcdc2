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

#include "redact/pii/span-recovery.h"

#include <stdlib.h>
#include <algorithm>
#include <set>
#include <utility>

#include "redact/base/logging.h"
#include "redact/util/unicode.h"

namespace redact {
namespace pii {

namespace {

// Normalization for matching rewritten values against the source text.
const int kMatchNormalization = NORMALIZE_MATCH;

// Normalized code point range with the original position of each normalized
// code point.
struct NormalizedText {
  NormalizedText(const ustring &text, int begin, int end) {
    for (int i = begin; i < end; ++i) {
      int c = Unicode::Normalize(text[i], kMatchNormalization);
      if (c <= 0) continue;
      codes.push_back(c);
      positions.push_back(i);
    }
  }

  // Return index of first normalized code point at or after position.
  int IndexOf(int position) const {
    return std::lower_bound(positions.begin(), positions.end(), position) -
           positions.begin();
  }

  // Original span of normalized match [index;index+length[.
  int Begin(int index) const { return positions[index]; }
  int End(int index, int length) const {
    return positions[index + length - 1] + 1;
  }

  // Find needle starting at normalized index. Returns -1 if not found.
  int Find(const ustring &needle, int from) const {
    if (needle.empty() || from > codes.size()) return -1;
    auto it = std::search(codes.begin() + from, codes.end(),
                          needle.begin(), needle.end());
    if (it == codes.end()) return -1;
    return it - codes.begin();
  }

  ustring codes;
  std::vector<int> positions;
};

// Decode and normalize string for matching.
ustring NormalizeString(const string &str) {
  ustring decoded;
  UTF8::DecodeString(str, &decoded);
  ustring normalized;
  for (int c : decoded) {
    c = Unicode::Normalize(c, kMatchNormalization);
    if (c > 0) normalized.push_back(c);
  }
  return normalized;
}

// Remove whitespace from both ends of code point range.
void Trim(const ustring &text, int *begin, int *end) {
  while (*begin < *end && Unicode::IsWhitespace(text[*begin])) (*begin)++;
  while (*end > *begin && Unicode::IsWhitespace(text[*end - 1])) (*end)--;
}

}  // namespace

RecoveryOutcome SpanRecovery::Recover(const SourceText &text,
                                      const TaggedValue &value,
                                      int pointer) const {
  RecoveryOutcome outcome;

  // Only tags from the generative vocabulary can be recovered.
  if (!config_->normalizer().Lookup(value.tag, GENERATIVE, &outcome.type)) {
    outcome.reason = TAG_UNRECOGNIZED;
    return outcome;
  }

  const ustring &codes = text.codes();
  int length = codes.size();
  pointer = std::min(std::max(pointer, 0), length);

  ustring needle;
  UTF8::DecodeString(value.value, &needle);
  int begin = 0;
  int end = needle.size();
  Trim(needle, &begin, &end);
  needle.assign(needle.begin() + begin, needle.begin() + end);

  if (!needle.empty()) {
    // Try exact match in the unconsumed text.
    auto it = std::search(codes.begin() + pointer, codes.end(),
                          needle.begin(), needle.end());
    if (it != codes.end()) {
      outcome.recovered = true;
      outcome.begin = it - codes.begin();
      outcome.end = outcome.begin + needle.size();
      return outcome;
    }

    // Try match after normalizing width, case, whitespace, and punctuation.
    NormalizedText region(codes, pointer, length);
    ustring normalized = NormalizeString(value.value);
    int index = region.Find(normalized, 0);
    if (index != -1) {
      outcome.recovered = true;
      outcome.begin = region.Begin(index);
      outcome.end = region.End(index, normalized.size());
      return outcome;
    }
  }

  // Fall back to the context anchors.
  RecoverFromAnchors(text, value, needle.size(), pointer, &outcome);
  return outcome;
}

void SpanRecovery::RecoverFromAnchors(const SourceText &text,
                                      const TaggedValue &value,
                                      int value_length, int pointer,
                                      RecoveryOutcome *outcome) const {
  const ustring &codes = text.codes();
  int limit = std::min(text.length(), pointer + config_->search_window());
  ustring left = NormalizeString(value.left_context);
  ustring right = NormalizeString(value.right_context);
  if (left.empty() && right.empty()) {
    outcome->reason = value_length == 0 ? ANCHOR_MISSING : NO_MATCH;
    return;
  }
  NormalizedText region(codes, pointer, limit);

  // Each left anchor opens a window that the next right anchor closes. A
  // missing anchor is replaced by the edge of the search region.
  std::vector<int> starts;
  if (left.empty()) {
    starts.push_back(pointer);
  } else {
    int index = region.Find(left, 0);
    while (index != -1) {
      starts.push_back(region.End(index, left.size()));
      index = region.Find(left, index + 1);
    }
  }
  std::vector<std::pair<int, int>> windows;
  for (int start : starts) {
    int finish = limit;
    if (!right.empty()) {
      int index = region.Find(right, region.IndexOf(start));
      if (index == -1) continue;
      finish = region.Begin(index);
    }
    windows.emplace_back(start, finish);
  }
  if (windows.empty()) {
    outcome->reason = ANCHOR_MISSING;
    return;
  }

  // Select windows with acceptable length.
  std::set<std::pair<int, int>> accepted;
  for (auto &window : windows) {
    int begin = window.first;
    int end = window.second;
    Trim(codes, &begin, &end);
    int size = end - begin;
    if (size <= 0) continue;
    bool acceptable;
    if (value_length > 0) {
      float deviation = abs(size - value_length);
      acceptable = deviation <= config_->length_tolerance() * value_length;
    } else {
      acceptable = size <= config_->max_span(outcome->type);
    }
    if (acceptable) accepted.emplace(begin, end);
  }

  if (accepted.size() == 1) {
    outcome->recovered = true;
    outcome->begin = accepted.begin()->first;
    outcome->end = accepted.begin()->second;
  } else if (accepted.size() > 1) {
    outcome->reason = AMBIGUOUS_MATCH;
  } else {
    outcome->reason = LENGTH_MISMATCH;
  }
}

void SpanRecovery::RecoverAll(const SourceText &text,
                              const std::vector<TaggedValue> &values,
                              Candidates *candidates,
                              DiscardSink *sink) const {
  int pointer = 0;
  for (const TaggedValue &value : values) {
    RecoveryOutcome outcome = Recover(text, value, pointer);
    if (outcome.recovered) {
      DCHECK(outcome.begin >= pointer && outcome.end <= text.length());
      candidates->emplace_back(outcome.begin, outcome.end, outcome.type,
                               value.tag, config_->base_score(), GENERATIVE);
      pointer = outcome.end;
    } else {
      DiscardEvent event;
      event.category = RECOVERY_DISCARD;
      event.reason = outcome.reason;
      event.source = GENERATIVE;
      event.text = value.value.empty() ? "<" + value.tag + ">" : value.value;
      event.raw_type = value.tag;
      ReportDiscard(sink, event);
    }
  }
}

}  // namespace pii
}  // namespace redact
