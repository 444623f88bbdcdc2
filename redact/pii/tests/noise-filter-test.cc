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

#include <iostream>
#include <string>

#include "redact/base/init.h"
#include "redact/base/logging.h"
#include "redact/pii/discard.h"
#include "redact/pii/noise-filter.h"

using namespace redact;
using namespace redact::pii;

static bool IsNoise(const string &str) {
  NoiseFilter filter(0.5);
  ustring codes;
  UTF8::DecodeString(str, &codes);
  return filter.IsNoise(codes, 0, codes.size());
}

static void TestNoise() {
  CHECK(IsNoise("~\n\n"));
  CHECK(IsNoise("---"));
  CHECK(IsNoise("  "));
  CHECK(IsNoise("。、"));
  CHECK(IsNoise("A.-.-."));
  CHECK(IsNoise(""));

  CHECK(!IsNoise("山田"));
  CHECK(!IsNoise("090-1234"));
  CHECK(!IsNoise("a b"));
  CHECK(!IsNoise("John Smith"));
  CHECK(!IsNoise("〒150-0001"));
}

static void TestFilter() {
  NoiseFilter filter(0.5);
  SourceText text("山田~\n\n太郎");
  Candidates candidates = {
    Candidate(0, 2, PERSON, "PER", 0.9, NER),
    Candidate(2, 5, PERSON, "PER", 0.9, NER),
    Candidate(5, 7, PERSON, "PER", 0.9, NER),
  };
  DiscardCollector discards;
  filter.Filter(text, &candidates, &discards);
  CHECK_EQ(candidates.size(), 2);
  CHECK_EQ(candidates[0].begin, 0);
  CHECK_EQ(candidates[1].begin, 5);

  CHECK_EQ(discards.events().size(), 1);
  const DiscardEvent &event = discards.events()[0];
  CHECK_EQ(event.category, NOISE_REJECT);
  CHECK_EQ(event.reason, NOISE_CONTENT);
  CHECK_EQ(event.text, "~\n\n");
  CHECK_EQ(event.begin, 2);
  CHECK_EQ(event.end, 5);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestNoise();
  TestFilter();

  std::cout << "PASS\n";
  return 0;
}
