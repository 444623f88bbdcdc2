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
#include "redact/pii/consensus.h"
#include "redact/pii/discard.h"

using namespace redact;
using namespace redact::pii;

static void TestAgree() {
  ConsensusEngine engine(0.5);
  Candidate a(0, 4, PERSON, "PER", 0.6, NER);
  Candidate b(0, 4, PERSON, "JP_PERSON", 0.9, PATTERN);
  CHECK(engine.Agree(a, b));

  // Different types never agree.
  Candidate c(0, 4, LOCATION, "LOC", 0.9, NER);
  CHECK(!engine.Agree(a, c));

  // Overlap relative to the shorter span.
  Candidate d(0, 10, PERSON, "PER", 0.5, NER);
  Candidate e(8, 12, PERSON, "PER", 0.5, TRANSFORMER);
  CHECK(engine.Agree(d, e));
  Candidate f(9, 14, PERSON, "PER", 0.5, TRANSFORMER);
  CHECK(!engine.Agree(d, f));

  // Adjacent spans do not overlap.
  Candidate g(10, 12, PERSON, "PER", 0.5, TRANSFORMER);
  CHECK(!engine.Agree(d, g));

  // A low threshold still requires some overlap.
  ConsensusEngine lenient(0.01);
  CHECK(lenient.Agree(d, f));
  CHECK(!lenient.Agree(d, g));
}

static void TestConsensus() {
  ConsensusEngine engine(0.5);
  SourceText text("山田太郎");
  Candidates first = {Candidate(0, 4, PERSON, "PER", 0.6, NER)};
  Candidates second = {Candidate(0, 4, PERSON, "JP_PERSON", 0.9, PATTERN)};
  Candidates result;
  DiscardCollector discards;
  engine.Reconcile(text, first, second, &result, &discards);

  CHECK_EQ(result.size(), 1);
  CHECK_EQ(result[0].begin, 0);
  CHECK_EQ(result[0].end, 4);
  CHECK_EQ(result[0].type, PERSON);
  CHECK_EQ(result[0].source, CONSENSUS);
  CHECK_EQ(result[0].score, 0.9f);
  CHECK_EQ(result[0].raw_type, "PER");
  CHECK_EQ(result[0].partner_type, "JP_PERSON");
  CHECK(discards.events().empty());
}

static void TestUnionSpan() {
  ConsensusEngine engine(0.5);
  SourceText text("東京都渋谷区神南");
  Candidates first = {Candidate(0, 6, LOCATION, "JP_ADDRESS", 0.7, PATTERN)};
  Candidates second = {Candidate(3, 8, LOCATION, "地名", 0.8, TRANSFORMER)};
  Candidates result;
  engine.Reconcile(text, first, second, &result, nullptr);
  CHECK_EQ(result.size(), 1);
  CHECK_EQ(result[0].begin, 0);
  CHECK_EQ(result[0].end, 8);
  CHECK_EQ(result[0].score, 0.8f);
}

static void TestRejections() {
  ConsensusEngine engine(0.5);
  SourceText text("Jane Doe lives in Springfield today");
  Candidates first = {
    Candidate(0, 10, PERSON, "PER", 0.9, NER),
    Candidate(18, 29, LOCATION, "LOC", 0.9, NER),
    Candidate(30, 35, ORGANIZATION, "ORG", 0.9, NER),
  };
  Candidates second = {
    Candidate(9, 14, PERSON, "JP_PERSON", 0.9, PATTERN),
    Candidate(18, 29, PERSON, "JP_PERSON", 0.9, PATTERN),
  };
  Candidates result;
  DiscardCollector discards;
  engine.Reconcile(text, first, second, &result, &discards);

  CHECK(result.empty());
  CHECK_EQ(discards.count(CONSENSUS_REJECT), 5);

  // The person candidates overlap too little.
  CHECK_EQ(discards.count(INSUFFICIENT_OVERLAP), 2);

  // The location candidate only overlaps a person candidate and vice versa.
  CHECK_EQ(discards.count(TYPE_MISMATCH), 2);

  // Nothing overlaps the organization candidate.
  CHECK_EQ(discards.count(NO_COUNTERPART), 1);

  for (const DiscardEvent &event : discards.events()) {
    if (event.reason == NO_COUNTERPART) {
      CHECK_EQ(event.text, "today");
      CHECK_EQ(event.begin, 30);
      CHECK_EQ(event.end, 35);
      CHECK_EQ(event.source, NER);
    }
  }
}

static void TestBestPartner() {
  ConsensusEngine engine(0.5);
  SourceText text("0123456789");
  Candidate a(0, 6, PERSON, "JP_PERSON", 0.5, PATTERN);

  // Highest score wins.
  Candidates second = {
    Candidate(0, 6, PERSON, "PER", 0.6, NER),
    Candidate(1, 5, PERSON, "人名", 0.8, TRANSFORMER),
  };
  Candidates result;
  DiscardCollector discards;
  engine.Reconcile(text, {a}, second, &result, &discards);
  CHECK_EQ(result.size(), 1);
  CHECK_EQ(result[0].partner_type, "人名");
  CHECK_EQ(result[0].begin, 0);
  CHECK_EQ(result[0].end, 6);
  CHECK_EQ(discards.count(CONSENSUS_REJECT), 1);

  // Equal score prefers the larger overlap.
  second = {
    Candidate(3, 7, PERSON, "PER", 0.8, NER),
    Candidate(0, 6, PERSON, "人名", 0.8, TRANSFORMER),
  };
  result.clear();
  engine.Reconcile(text, {a}, second, &result, nullptr);
  CHECK_EQ(result.size(), 1);
  CHECK_EQ(result[0].partner_type, "人名");

  // Equal score and overlap prefers the earlier span.
  second = {
    Candidate(2, 6, PERSON, "PER", 0.8, NER),
    Candidate(1, 5, PERSON, "人名", 0.8, TRANSFORMER),
  };
  result.clear();
  engine.Reconcile(text, {a}, second, &result, nullptr);
  CHECK_EQ(result.size(), 1);
  CHECK_EQ(result[0].partner_type, "人名");
  CHECK_EQ(result[0].begin, 0);
}

static void TestSingleUse() {
  // Each candidate of the second detector pairs with at most one candidate.
  ConsensusEngine engine(0.5);
  SourceText text("0123456789");
  Candidates first = {
    Candidate(0, 4, PHONE, "PHONE_NUMBER", 0.9, PATTERN),
    Candidate(0, 4, PHONE, "PHONE_NUMBER_JP", 0.9, PATTERN),
  };
  Candidates second = {Candidate(0, 4, PHONE, "PHONE_NUMBER", 0.7, NER)};
  Candidates result;
  DiscardCollector discards;
  engine.Reconcile(text, first, second, &result, &discards);
  CHECK_EQ(result.size(), 1);
  CHECK_EQ(result[0].raw_type, "PHONE_NUMBER");
  CHECK_EQ(discards.count(CONSENSUS_REJECT), 1);
}

static void TestEmptySide() {
  ConsensusEngine engine(0.5);
  SourceText text("山田太郎");
  Candidates some = {Candidate(0, 4, PERSON, "PER", 0.6, NER)};
  Candidates none;
  Candidates result;
  DiscardCollector discards;
  engine.Reconcile(text, none, some, &result, &discards);
  CHECK(result.empty());
  CHECK_EQ(discards.count(NO_COUNTERPART), 1);

  discards.clear();
  engine.Reconcile(text, some, none, &result, &discards);
  CHECK(result.empty());
  CHECK_EQ(discards.count(NO_COUNTERPART), 1);

  engine.Reconcile(text, none, none, &result, nullptr);
  CHECK(result.empty());
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestAgree();
  TestConsensus();
  TestUnionSpan();
  TestRejections();
  TestBestPartner();
  TestSingleUse();
  TestEmptySide();

  std::cout << "PASS\n";
  return 0;
}
