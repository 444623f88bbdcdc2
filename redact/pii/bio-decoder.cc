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

#include "redact/pii/bio-decoder.h"

#include "redact/base/logging.h"

namespace redact {
namespace pii {

void BioDecoder::Decode(const std::vector<LabelledToken> &tokens,
                        Candidates *entities) const {
  OpenEntity entity;
  for (const LabelledToken &token : tokens) {
    // Classify label. Unknown labels are treated as outside labels.
    string base;
    LabelPosition position = SplitLabel(token.label, &base);
    EntityType type = UNKNOWN;
    if (position != LABEL_OUTSIDE &&
        !normalizer_->Lookup(base, source_, &type)) {
      VLOG(2) << "Unknown token label " << token.label;
      position = LABEL_OUTSIDE;
    }
    bool same = entity.state == INSIDE && entity.type == type;

    switch (position) {
      case LABEL_OUTSIDE:
        Close(&entity, entities);
        break;

      case LABEL_BEGIN:
        Close(&entity, entities);
        Open(token, type, base, &entity);
        break;

      case LABEL_INSIDE:
      case LABEL_BARE:
        if (same) {
          Extend(token, &entity);
        } else {
          Close(&entity, entities);
          Open(token, type, base, &entity);
        }
        break;

      case LABEL_LAST:
        if (same) {
          Extend(token, &entity);
        } else {
          Close(&entity, entities);
          Open(token, type, base, &entity);
        }
        Close(&entity, entities);
        break;

      case LABEL_SINGLE:
        Close(&entity, entities);
        Open(token, type, base, &entity);
        Close(&entity, entities);
        break;
    }
  }
  Close(&entity, entities);
}

void BioDecoder::Open(const LabelledToken &token, EntityType type,
                      const string &label, OpenEntity *entity) const {
  DCHECK_EQ(entity->state, OUTSIDE);
  entity->state = INSIDE;
  entity->type = type;
  entity->label = label;
  entity->begin = token.begin;
  entity->end = token.end;
  entity->score_sum = token.score;
  entity->tokens = 1;
}

void BioDecoder::Extend(const LabelledToken &token, OpenEntity *entity) const {
  DCHECK_EQ(entity->state, INSIDE);
  if (token.end > entity->end) entity->end = token.end;
  entity->score_sum += token.score;
  entity->tokens++;
}

void BioDecoder::Close(OpenEntity *entity, Candidates *entities) const {
  if (entity->state == OUTSIDE) return;
  float score = entity->score_sum / entity->tokens;
  if (score >= min_score_) {
    entities->emplace_back(entity->begin, entity->end, entity->type,
                           entity->label, score, source_);
  }
  entity->state = OUTSIDE;
}

}  // namespace pii
}  // namespace redact
