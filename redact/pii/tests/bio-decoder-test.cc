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

#include <math.h>
#include <iostream>
#include <string>
#include <vector>

#include "redact/base/init.h"
#include "redact/base/logging.h"
#include "redact/pii/bio-decoder.h"
#include "redact/pii/type-normalizer.h"

using namespace redact;
using namespace redact::pii;

static TypeNormalizer *normalizer = nullptr;

// Decode tokens with labels from the transformer vocabulary.
static Candidates Decode(const std::vector<LabelledToken> &tokens,
                         float min_score = 0.0) {
  BioDecoder decoder(normalizer, TRANSFORMER, min_score);
  Candidates entities;
  decoder.Decode(tokens, &entities);
  return entities;
}

static bool Near(float a, float b) {
  return fabs(a - b) < 1e-5;
}

static void TestBeginInside() {
  // 山田 太郎 は 東京 に
  Candidates entities = Decode({
    {0, 2, "B-人名", 0.9},
    {2, 4, "I-人名", 0.7},
    {4, 5, "O", 0.99},
    {5, 7, "B-地名", 0.8},
    {7, 8, "O", 0.99},
  });
  CHECK_EQ(entities.size(), 2);
  CHECK_EQ(entities[0].begin, 0);
  CHECK_EQ(entities[0].end, 4);
  CHECK_EQ(entities[0].type, PERSON);
  CHECK_EQ(entities[0].raw_type, "人名");
  CHECK_EQ(entities[0].source, TRANSFORMER);
  CHECK(Near(entities[0].score, 0.8));
  CHECK_EQ(entities[1].begin, 5);
  CHECK_EQ(entities[1].end, 7);
  CHECK_EQ(entities[1].type, LOCATION);
}

static void TestTypeChange() {
  // An inside label of another type closes the open entity.
  Candidates entities = Decode({
    {0, 3, "B-PER", 1.0},
    {4, 9, "I-LOC", 1.0},
    {10, 14, "I-LOC", 1.0},
  });
  CHECK_EQ(entities.size(), 2);
  CHECK_EQ(entities[0].type, PERSON);
  CHECK_EQ(entities[0].end, 3);
  CHECK_EQ(entities[1].type, LOCATION);
  CHECK_EQ(entities[1].begin, 4);
  CHECK_EQ(entities[1].end, 14);

  // A begin label of the same type starts a new entity.
  entities = Decode({
    {0, 3, "B-PER", 1.0},
    {4, 9, "B-PER", 1.0},
  });
  CHECK_EQ(entities.size(), 2);
}

static void TestOrphanContinuation() {
  Candidates entities = Decode({
    {0, 4, "O", 1.0},
    {5, 9, "I-ORG", 0.6},
    {10, 12, "I-ORG", 0.8},
  });
  CHECK_EQ(entities.size(), 1);
  CHECK_EQ(entities[0].begin, 5);
  CHECK_EQ(entities[0].end, 12);
  CHECK_EQ(entities[0].type, ORGANIZATION);
  CHECK(Near(entities[0].score, 0.7));
}

static void TestUnknownLabel() {
  // Unknown labels act as outside labels.
  Candidates entities = Decode({
    {0, 3, "B-PER", 1.0},
    {3, 6, "B-MISC", 1.0},
    {6, 8, "I-MISC", 1.0},
  });
  CHECK_EQ(entities.size(), 1);
  CHECK_EQ(entities[0].begin, 0);
  CHECK_EQ(entities[0].end, 3);
}

static void TestBareLabels() {
  Candidates entities = Decode({
    {0, 2, "PER", 0.5},
    {2, 4, "PER", 1.0},
    {4, 6, "LOC", 1.0},
  });
  CHECK_EQ(entities.size(), 2);
  CHECK_EQ(entities[0].begin, 0);
  CHECK_EQ(entities[0].end, 4);
  CHECK(Near(entities[0].score, 0.75));
  CHECK_EQ(entities[1].begin, 4);
  CHECK_EQ(entities[1].type, LOCATION);
}

static void TestBioes() {
  Candidates entities = Decode({
    {0, 1, "S-PER", 1.0},
    {1, 2, "B-LOC", 1.0},
    {2, 3, "I-LOC", 1.0},
    {3, 4, "E-LOC", 1.0},
    {4, 5, "I-LOC", 1.0},
    {5, 6, "U-ORG", 1.0},
    {6, 7, "L-ORG", 1.0},
  });
  CHECK_EQ(entities.size(), 5);
  CHECK_EQ(entities[0].begin, 0);
  CHECK_EQ(entities[0].end, 1);
  CHECK_EQ(entities[1].begin, 1);
  CHECK_EQ(entities[1].end, 4);
  CHECK_EQ(entities[2].begin, 4);
  CHECK_EQ(entities[2].end, 5);
  CHECK_EQ(entities[3].begin, 5);
  CHECK_EQ(entities[3].end, 6);
  CHECK_EQ(entities[4].begin, 6);
  CHECK_EQ(entities[4].end, 7);
  CHECK_EQ(entities[4].type, ORGANIZATION);
}

static void TestMinScore() {
  std::vector<LabelledToken> tokens = {
    {0, 3, "B-PER", 0.2},
    {3, 5, "I-PER", 0.4},
    {6, 9, "B-ORG", 0.9},
  };
  Candidates entities = Decode(tokens, 0.5);
  CHECK_EQ(entities.size(), 1);
  CHECK_EQ(entities[0].type, ORGANIZATION);
  CHECK_EQ(Decode(tokens).size(), 2);
}

static void TestEmpty() {
  CHECK(Decode({}).empty());
  CHECK(Decode({{0, 5, "O", 1.0}}).empty());
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);
  normalizer = new TypeNormalizer();
  normalizer->AddDefaults();

  TestBeginInside();
  TestTypeChange();
  TestOrphanContinuation();
  TestUnknownLabel();
  TestBareLabels();
  TestBioes();
  TestMinScore();
  TestEmpty();

  delete normalizer;
  std::cout << "PASS\n";
  return 0;
}
