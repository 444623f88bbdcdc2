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

#include "redact/pii/generation-parser.h"

#include "redact/base/logging.h"

namespace redact {
namespace pii {

namespace {

// Piece of generated text, either plain text or a tag.
struct Segment {
  bool tag = false;
  string name;     // tag name
  int begin = 0;   // plain text or tag value range
  int end = 0;
};

// Remove whitespace from both ends of code point range.
void Trim(const ustring &text, int *begin, int *end) {
  while (*begin < *end && Unicode::IsWhitespace(text[*begin])) (*begin)++;
  while (*end > *begin && Unicode::IsWhitespace(text[*end - 1])) (*end)--;
}

string Encode(const ustring &text, int begin, int end) {
  string result;
  UTF8::EncodeString(text, begin, end, &result);
  return result;
}

}  // namespace

GenerationParser::GenerationParser(const std::vector<string> &tags,
                                   int anchor_length)
    : tags_(tags.begin(), tags.end()), anchor_length_(anchor_length) {
  CHECK_GT(anchor_length, 0);
}

int GenerationParser::MatchTag(const ustring &text, int pos, bool closing,
                               string *name) const {
  int size = text.size();
  if (pos >= size || text[pos] != '<') return -1;
  int i = pos + 1;
  if (closing) {
    if (i >= size || text[i] != '/') return -1;
    i++;
  }
  int start = i;
  while (i < size && text[i] != '>' && text[i] != '<' && text[i] != '/' &&
         !Unicode::IsWhitespace(text[i])) {
    i++;
  }
  if (i == start || i >= size || text[i] != '>') return -1;
  string tag = Encode(text, start, i);
  if (tags_.count(tag) == 0) return -1;
  *name = tag;
  return i + 1;
}

int GenerationParser::FindClosingTag(const ustring &text, int pos,
                                     const string &name, int *after) const {
  for (int i = pos; i < text.size(); ++i) {
    if (text[i] != '<') continue;
    string other;
    int end = MatchTag(text, i, true, &other);
    if (end != -1 && other == name) {
      *after = end;
      return i;
    }
    if (MatchTag(text, i, false, &other) != -1) return -1;
  }
  return -1;
}

void GenerationParser::Parse(const string &generation,
                             std::vector<TaggedValue> *values) const {
  ustring text;
  UTF8::DecodeString(generation, &text);
  int size = text.size();

  // Split generation into plain text and tags.
  std::vector<Segment> segments;
  auto flush = [&segments](int begin, int end) {
    if (begin >= end) return;
    Segment segment;
    segment.begin = begin;
    segment.end = end;
    segments.push_back(segment);
  };
  int text_begin = 0;
  int i = 0;
  while (i < size) {
    if (text[i] == '<') {
      string name;
      int end = MatchTag(text, i, false, &name);
      if (end != -1) {
        flush(text_begin, i);
        Segment tag;
        tag.tag = true;
        tag.name = name;
        tag.begin = tag.end = end;

        // A closing tag before the next opening tag wraps the value.
        int after;
        int close = FindClosingTag(text, end, name, &after);
        if (close != -1) {
          tag.end = close;
          i = after;
        } else {
          i = end;
        }
        segments.push_back(tag);
        text_begin = i;
        continue;
      }

      // Drop unpaired closing tags.
      end = MatchTag(text, i, true, &name);
      if (end != -1) {
        flush(text_begin, i);
        text_begin = i = end;
        continue;
      }
    }
    i++;
  }
  flush(text_begin, size);

  // Output tagged values with the surrounding text as context.
  for (int k = 0; k < segments.size(); ++k) {
    const Segment &segment = segments[k];
    if (!segment.tag) continue;

    TaggedValue value;
    value.tag = segment.name;
    int begin = segment.begin;
    int end = segment.end;
    Trim(text, &begin, &end);
    value.value = Encode(text, begin, end);

    if (k > 0 && !segments[k - 1].tag) {
      int begin = segments[k - 1].begin;
      int end = segments[k - 1].end;
      Trim(text, &begin, &end);
      if (end - begin > anchor_length_) begin = end - anchor_length_;
      Trim(text, &begin, &end);
      value.left_context = Encode(text, begin, end);
    }
    if (k + 1 < segments.size() && !segments[k + 1].tag) {
      int begin = segments[k + 1].begin;
      int end = segments[k + 1].end;
      Trim(text, &begin, &end);
      if (end - begin > anchor_length_) end = begin + anchor_length_;
      Trim(text, &begin, &end);
      value.right_context = Encode(text, begin, end);
    }

    values->push_back(value);
  }
}

}  // namespace pii
}  // namespace redact
