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

#ifndef REDACT_PII_GENERATION_PARSER_H_
#define REDACT_PII_GENERATION_PARSER_H_

#include <string>
#include <unordered_set>
#include <vector>

#include "redact/base/types.h"
#include "redact/util/unicode.h"

namespace redact {
namespace pii {

// Value tagged by the generative model. The model rewrites the whole text, so
// the value has no offsets into the source text. The untagged text around the
// tag is kept as context for locating the value in the source text.
struct TaggedValue {
  TaggedValue() {}
  TaggedValue(const string &value, const string &tag,
              const string &left_context = "",
              const string &right_context = "")
      : value(value), tag(tag),
        left_context(left_context), right_context(right_context) {}

  string value;          // tagged text, empty for masked values
  string tag;            // tag name without angle brackets
  string left_context;   // untagged text before the tag
  string right_context;  // untagged text after the tag
};

// Splits the output of a generative tagging model into tagged values. The
// model output contains inline tags from a fixed tag set, either as masks,
// e.g. "<name>様", or wrapping the value, e.g. "<name>山田</name>様". Angle
// bracket sequences that are not known tags are plain text.
class GenerationParser {
 public:
  // Initialize parser for tag set. The contexts of the tagged values are
  // truncated to at most anchor_length code points.
  GenerationParser(const std::vector<string> &tags, int anchor_length);

  // Parse generated text into tagged values in generation order.
  void Parse(const string &generation, std::vector<TaggedValue> *values) const;

 private:
  // Match tag at position. Returns the end of the tag or -1 if there is no
  // known tag at the position.
  int MatchTag(const ustring &text, int pos, bool closing,
               string *name) const;

  // Find closing tag for name starting at position. Returns -1 if another
  // opening tag comes before the closing tag.
  int FindClosingTag(const ustring &text, int pos, const string &name,
                     int *after) const;

  // Known tag names.
  std::unordered_set<string> tags_;

  // Maximum context length.
  int anchor_length_;
};

}  // namespace pii
}  // namespace redact

#endif  // REDACT_PII_GENERATION_PARSER_H_
