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
#include <limits>
#include <string>
#include <vector>

#include "redact/base/init.h"
#include "redact/base/logging.h"
#include "redact/pii/config.h"
#include "redact/pii/discard.h"
#include "redact/pii/merger.h"

using namespace redact;
using namespace redact::pii;

static ReconcilerConfig *config = nullptr;

static Candidates Merge(const ReconcilerConfig *config, const string &text,
                        const Candidates &input,
                        DiscardSink *sink = nullptr) {
  Merger merger(config);
  SourceText source(text);
  Candidates output;
  merger.Merge(source, input, &output, sink);
  return output;
}

static Candidates Merge(const string &text, const Candidates &input,
                        DiscardSink *sink = nullptr) {
  return Merge(config, text, input, sink);
}

static void TestDifferentTypes() {
  // Candidates of different types that do not overlap are kept unchanged.
  Candidates output = Merge("Contact John Smith, john@x.com", {
    Candidate(20, 30, EMAIL, "EMAIL_ADDRESS", 1.0, PATTERN),
    Candidate(8, 18, PERSON, "PER", 0.8, NER),
  });
  CHECK_EQ(output.size(), 2);
  CHECK_EQ(output[0].type, PERSON);
  CHECK_EQ(output[0].begin, 8);
  CHECK_EQ(output[0].end, 18);
  CHECK_EQ(output[0].score, 0.8f);
  CHECK_EQ(output[1].type, EMAIL);
  CHECK_EQ(output[1].begin, 20);
  CHECK_EQ(output[1].end, 30);
  CHECK_EQ(output[1].raw_type, "EMAIL_ADDRESS");

  // Partial overlaps between types are kept.
  output = Merge("0123456789", {
    Candidate(0, 6, PERSON, "PER", 0.8, NER),
    Candidate(4, 10, LOCATION, "LOC", 0.8, NER),
  });
  CHECK_EQ(output.size(), 2);
}

static void TestContainment() {
  // Phone numbers outrank person names.
  Candidates output = Merge("Phone: 090-1234-5678 now", {
    Candidate(8, 12, PERSON, "PER", 0.9, TRANSFORMER),
    Candidate(5, 20, PHONE, "PHONE_NUMBER_JP", 0.7, PATTERN),
  });
  CHECK_EQ(output.size(), 1);
  CHECK_EQ(output[0].type, PHONE);
  CHECK_EQ(output[0].begin, 5);
  CHECK_EQ(output[0].end, 20);

  // A contained candidate with higher priority removes the outer candidate.
  output = Merge("mail me at x@y.jp please", {
    Candidate(0, 17, PERSON, "PER", 0.9, NER),
    Candidate(11, 17, EMAIL, "EMAIL_ADDRESS", 1.0, PATTERN),
  });
  CHECK_EQ(output.size(), 1);
  CHECK_EQ(output[0].type, EMAIL);

  // Identical spans keep the higher priority type.
  output = Merge("0123456789", {
    Candidate(0, 5, PERSON, "PER", 0.9, NER),
    Candidate(0, 5, EMAIL, "EMAIL_ADDRESS", 0.5, PATTERN),
  });
  CHECK_EQ(output.size(), 1);
  CHECK_EQ(output[0].type, EMAIL);
}

static void TestSameType() {
  // Overlapping candidates are joined.
  Candidates output = Merge("0123456789", {
    Candidate(0, 5, PERSON, "PER", 0.7, NER),
    Candidate(3, 8, PERSON, "人名", 0.9, TRANSFORMER),
  });
  CHECK_EQ(output.size(), 1);
  CHECK_EQ(output[0].begin, 0);
  CHECK_EQ(output[0].end, 8);
  CHECK_EQ(output[0].score, 0.9f);

  // Adjacent candidates are joined.
  output = Merge("0123456789", {
    Candidate(4, 8, LOCATION, "LOC", 0.5, NER),
    Candidate(0, 4, LOCATION, "LOC", 0.5, NER),
  });
  CHECK_EQ(output.size(), 1);
  CHECK_EQ(output[0].begin, 0);
  CHECK_EQ(output[0].end, 8);

  // Candidates separated by a gap stay apart.
  output = Merge("0123456789", {
    Candidate(0, 4, LOCATION, "LOC", 0.5, NER),
    Candidate(5, 8, LOCATION, "LOC", 0.5, NER),
  });
  CHECK_EQ(output.size(), 2);

  // Chains of overlaps collapse into one entity.
  output = Merge("0123456789", {
    Candidate(0, 3, ORGANIZATION, "ORG", 0.5, NER),
    Candidate(2, 5, ORGANIZATION, "ORG", 0.5, NER),
    Candidate(5, 9, ORGANIZATION, "ORG", 0.5, NER),
  });
  CHECK_EQ(output.size(), 1);
  CHECK_EQ(output[0].end, 9);
}

static void TestInvalidSpans() {
  DiscardCollector discards;
  Candidates output = Merge("0123456789", {
    Candidate(-1, 3, PERSON, "PER", 0.5, NER),
    Candidate(5, 5, PERSON, "PER", 0.5, NER),
    Candidate(8, 100, PERSON, "PER", 0.5, NER),
    Candidate(1, 3, PERSON, "PER", 0.5, NER),
  }, &discards);
  CHECK_EQ(output.size(), 1);
  CHECK_EQ(output[0].begin, 1);
  CHECK_EQ(discards.count(INVALID_SPAN), 3);

  // Scores must be finite.
  DiscardCollector invalid;
  output = Merge("0123456789", {
    Candidate(0, 4, PHONE, "PHONE_NUMBER",
              std::numeric_limits<float>::quiet_NaN(), PATTERN),
    Candidate(2, 3, PERSON, "PER", 0.5, NER),
  }, &invalid);
  CHECK_EQ(output.size(), 1);
  CHECK_EQ(output[0].type, PERSON);
  CHECK_EQ(invalid.count(INVALID_SPAN), 1);
}

static void TestIdempotent() {
  string text = "山田太郎は東京都渋谷区に住んでいます。電話090-1234-5678";
  Candidates input = {
    Candidate(0, 2, PERSON, "PER", 0.6, NER),
    Candidate(1, 4, PERSON, "人名", 0.9, TRANSFORMER),
    Candidate(5, 11, LOCATION, "JP_ADDRESS", 0.7, PATTERN),
    Candidate(5, 8, LOCATION, "地名", 0.7, TRANSFORMER),
    Candidate(8, 10, PERSON, "PER", 0.3, NER),
    Candidate(21, 34, PHONE, "PHONE_NUMBER_JP", 1.0, PATTERN),
    Candidate(23, 27, CUSTOMER_ID, "CUSTOMER_ID_JP", 0.4, PATTERN),
  };
  Candidates once = Merge(text, input);
  Candidates twice = Merge(text, once);
  CHECK_EQ(once.size(), 3);
  CHECK_EQ(once.size(), twice.size());
  for (int i = 0; i < once.size(); ++i) {
    CHECK_EQ(once[i].begin, twice[i].begin);
    CHECK_EQ(once[i].end, twice[i].end);
    CHECK_EQ(once[i].type, twice[i].type);
    CHECK_EQ(once[i].score, twice[i].score);
  }

  // No two entities of the same type overlap or touch.
  for (int i = 0; i < once.size(); ++i) {
    for (int j = i + 1; j < once.size(); ++j) {
      if (once[i].type == once[j].type) CHECK(!once[i].Touches(once[j]));
    }
  }
}

static void TestPriority() {
  // Person names first.
  ReconcilerOptions options;
  options.priority = {PERSON, PHONE};
  ReconcilerConfig custom;
  CHECK(custom.Init(options));
  Candidates input = {
    Candidate(8, 12, PERSON, "PER", 0.9, TRANSFORMER),
    Candidate(5, 20, PHONE, "PHONE_NUMBER_JP", 0.7, PATTERN),
  };
  Candidates output = Merge(&custom, "Phone: 090-1234-5678 now", input);
  CHECK_EQ(output.size(), 1);
  CHECK_EQ(output[0].type, PERSON);

  // Types outside the priority order rank lowest.
  input = {
    Candidate(0, 10, LOCATION, "LOC", 0.9, NER),
    Candidate(2, 5, PERSON, "PER", 0.9, NER),
  };
  output = Merge(&custom, "0123456789", input);
  CHECK_EQ(output.size(), 1);
  CHECK_EQ(output[0].type, PERSON);

  // Types with equal rank are both kept.
  input = {
    Candidate(0, 10, LOCATION, "LOC", 0.9, NER),
    Candidate(2, 5, ORGANIZATION, "ORG", 0.9, NER),
  };
  output = Merge(&custom, "0123456789", input);
  CHECK_EQ(output.size(), 2);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);
  config = new ReconcilerConfig();
  CHECK(config->Init(ReconcilerOptions()));

  TestDifferentTypes();
  TestContainment();
  TestSameType();
  TestInvalidSpans();
  TestIdempotent();
  TestPriority();

  delete config;
  std::cout << "PASS\n";
  return 0;
}
