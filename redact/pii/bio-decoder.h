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

#ifndef REDACT_PII_BIO_DECODER_H_
#define REDACT_PII_BIO_DECODER_H_

#include <string>
#include <vector>

#include "redact/base/types.h"
#include "redact/pii/candidate.h"
#include "redact/pii/entity-type.h"
#include "redact/pii/type-normalizer.h"

namespace redact {
namespace pii {

// Labelled token from a token classifier.
struct LabelledToken {
  int begin;      // first code point of token
  int end;        // end of token (exclusive)
  string label;   // raw label, e.g. "B-PER", "I-PER", "O"
  float score;    // label confidence
};

// Decodes sequences of per-token labels into entity candidates. The decoder
// is a state machine with two states, OUTSIDE and INSIDE(type):
//
//   label         OUTSIDE          INSIDE(X)         INSIDE(Y), Y != X
//   O, unknown    -                close             close
//   B-X           open X           close, open X     close, open X
//   I-X           open X           extend            close, open X
//   E-X           open X, close    extend, close     close, open X, close
//   S-X           open X, close    close, open X,    close, open X,
//                                  close             close
//   X             open X           extend            close, open X
//
// I-X outside an entity is an orphan continuation and starts a new entity.
// The score of an entity is the mean score of its tokens.
class BioDecoder {
 public:
  // Initialize decoder for the label vocabulary of a detector source.
  BioDecoder(const TypeNormalizer *normalizer, Source source,
             float min_score = 0.0)
      : normalizer_(normalizer), source_(source), min_score_(min_score) {}

  // Decode labelled tokens and append entity candidates.
  void Decode(const std::vector<LabelledToken> &tokens,
              Candidates *entities) const;

 private:
  // Decoder state.
  enum State { OUTSIDE, INSIDE };

  // Entity being built.
  struct OpenEntity {
    State state = OUTSIDE;
    EntityType type = UNKNOWN;
    string label;
    int begin = 0;
    int end = 0;
    float score_sum = 0.0;
    int tokens = 0;
  };

  // Start new entity from token.
  void Open(const LabelledToken &token, EntityType type, const string &label,
            OpenEntity *entity) const;

  // Add token to open entity.
  void Extend(const LabelledToken &token, OpenEntity *entity) const;

  // Emit open entity, if any, and go to the OUTSIDE state.
  void Close(OpenEntity *entity, Candidates *entities) const;

  const TypeNormalizer *normalizer_;
  Source source_;
  float min_score_;
};

}  // namespace pii
}  // namespace redact

#endif  // REDACT_PII_BIO_DECODER_H_
