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
#include <vector>

#include "redact/base/init.h"
#include "redact/base/logging.h"
#include "redact/pii/config.h"
#include "redact/pii/discard.h"
#include "redact/pii/span-recovery.h"

using namespace redact;
using namespace redact::pii;

static ReconcilerConfig *config = nullptr;

static RecoveryOutcome Recover(const string &text, const TaggedValue &value,
                               int pointer = 0) {
  SpanRecovery recovery(config);
  SourceText source(text);
  return recovery.Recover(source, value, pointer);
}

static void TestPointer() {
  // The first occurrence lies before the consumption pointer.
  string text = "aaaaaaaaaa東京都渋谷区" + string(24, 'b') + "東京都渋谷区";
  RecoveryOutcome outcome =
      Recover(text, TaggedValue("東京都渋谷区", "address"), 13);
  CHECK(outcome.recovered);
  CHECK_EQ(outcome.begin, 40);
  CHECK_EQ(outcome.end, 46);
  CHECK_EQ(outcome.type, LOCATION);

  outcome = Recover(text, TaggedValue("東京都渋谷区", "address"), 0);
  CHECK(outcome.recovered);
  CHECK_EQ(outcome.begin, 10);
  CHECK_EQ(outcome.end, 16);
}

static void TestExactMatch() {
  RecoveryOutcome outcome =
      Recover("Contact John Smith today.", TaggedValue("John Smith", "name"));
  CHECK(outcome.recovered);
  CHECK_EQ(outcome.begin, 8);
  CHECK_EQ(outcome.end, 18);
  CHECK_EQ(outcome.type, PERSON);

  // Surrounding whitespace in the value is ignored.
  outcome = Recover("Contact John Smith today.",
                    TaggedValue(" John Smith ", "name"));
  CHECK(outcome.recovered);
  CHECK_EQ(outcome.begin, 8);
  CHECK_EQ(outcome.end, 18);
}

static void TestNormalizedMatch() {
  // Full-width letters and ideographic space in the source text.
  RecoveryOutcome outcome =
      Recover("Name: ＪＯＨＮ　ＳＭＩＴＨ.", TaggedValue("john smith", "name"));
  CHECK(outcome.recovered);
  CHECK_EQ(outcome.begin, 6);
  CHECK_EQ(outcome.end, 16);

  // Punctuation differences.
  outcome = Recover("Tel: 090 1234 5678", TaggedValue("090-1234-5678",
                                                      "phone-number"));
  CHECK(outcome.recovered);
  CHECK_EQ(outcome.begin, 5);
  CHECK_EQ(outcome.end, 18);
  CHECK_EQ(outcome.type, PHONE);
}

static void TestUnrecognizedTag() {
  RecoveryOutcome outcome =
      Recover("I like tennis.", TaggedValue("tennis", "hobby"));
  CHECK(!outcome.recovered);
  CHECK_EQ(outcome.reason, TAG_UNRECOGNIZED);
}

static void TestAnchors() {
  // Masked value between anchors.
  string text = "お客様山田太郎様の住所は東京です。";
  RecoveryOutcome outcome =
      Recover(text, TaggedValue("", "name", "お客様", "様の住所は"));
  CHECK(outcome.recovered);
  CHECK_EQ(outcome.begin, 3);
  CHECK_EQ(outcome.end, 7);
  CHECK_EQ(outcome.type, PERSON);

  // Rewritten value with similar length.
  outcome = Recover(text, TaggedValue("ヤマダ太郎", "name", "お客様", "様の住所は"));
  CHECK(outcome.recovered);
  CHECK_EQ(outcome.begin, 3);
  CHECK_EQ(outcome.end, 7);

  // Rewritten value with very different length.
  outcome = Recover(text, TaggedValue("ヤマダタロウヤマダタロウ", "name",
                                      "お客様", "様の住所は"));
  CHECK(!outcome.recovered);
  CHECK_EQ(outcome.reason, LENGTH_MISMATCH);

  // Masked value longer than the maximum span for the type.
  string longer = "お客様" + string(50, 'x') + "様の住所は";
  outcome = Recover(longer, TaggedValue("", "name", "お客様", "様の住所は"));
  CHECK(!outcome.recovered);
  CHECK_EQ(outcome.reason, LENGTH_MISMATCH);

  // Only a right anchor.
  outcome = Recover("山田太郎様の住所", TaggedValue("", "name", "", "様の"));
  CHECK(outcome.recovered);
  CHECK_EQ(outcome.begin, 0);
  CHECK_EQ(outcome.end, 4);
}

static void TestAmbiguous() {
  RecoveryOutcome outcome = Recover("名前は田中です。名前は佐藤です。",
                                    TaggedValue("", "name", "名前は", "です"));
  CHECK(!outcome.recovered);
  CHECK_EQ(outcome.reason, AMBIGUOUS_MATCH);

  // Windows with the same span are not ambiguous.
  outcome = Recover("名前は田中です。", TaggedValue("", "name", "名前は", "です"));
  CHECK(outcome.recovered);
  CHECK_EQ(outcome.begin, 3);
  CHECK_EQ(outcome.end, 5);
}

static void TestMissingAnchors() {
  RecoveryOutcome outcome = Recover("Hello there.", TaggedValue("", "name"));
  CHECK(!outcome.recovered);
  CHECK_EQ(outcome.reason, ANCHOR_MISSING);

  outcome = Recover("Hello there.",
                    TaggedValue("", "name", "存在しない", ""));
  CHECK(!outcome.recovered);
  CHECK_EQ(outcome.reason, ANCHOR_MISSING);

  outcome = Recover("Hello there.", TaggedValue("Alice", "name"));
  CHECK(!outcome.recovered);
  CHECK_EQ(outcome.reason, NO_MATCH);
}

static void TestSearchWindow() {
  string text = string(800, 'x') + "。住所は東京都です";
  TaggedValue value("", "address", "住所は", "です");
  RecoveryOutcome outcome = Recover(text, value, 0);
  CHECK(!outcome.recovered);
  CHECK_EQ(outcome.reason, ANCHOR_MISSING);

  outcome = Recover(text, value, 790);
  CHECK(outcome.recovered);
  CHECK_EQ(outcome.begin, 804);
  CHECK_EQ(outcome.end, 807);
}

static void TestRecoverAll() {
  SpanRecovery recovery(config);
  SourceText text("John met John.");
  std::vector<TaggedValue> values = {
    TaggedValue("John", "name"),
    TaggedValue("John", "name"),
    TaggedValue("John", "name"),
  };
  Candidates candidates;
  DiscardCollector discards;
  recovery.RecoverAll(text, values, &candidates, &discards);

  CHECK_EQ(candidates.size(), 2);
  CHECK_EQ(candidates[0].begin, 0);
  CHECK_EQ(candidates[0].end, 4);
  CHECK_EQ(candidates[1].begin, 9);
  CHECK_EQ(candidates[1].end, 13);
  for (const Candidate &c : candidates) {
    CHECK_EQ(c.source, GENERATIVE);
    CHECK_EQ(c.type, PERSON);
    CHECK_EQ(c.raw_type, "name");
    CHECK_EQ(c.score, config->base_score());
  }

  CHECK_EQ(discards.events().size(), 1);
  const DiscardEvent &event = discards.events()[0];
  CHECK_EQ(event.category, RECOVERY_DISCARD);
  CHECK_EQ(event.reason, NO_MATCH);
  CHECK_EQ(event.source, GENERATIVE);
  CHECK_EQ(event.text, "John");

  // Masked values are reported with their tag.
  discards.clear();
  candidates.clear();
  recovery.RecoverAll(text, {TaggedValue("", "address")}, &candidates,
                      &discards);
  CHECK(candidates.empty());
  CHECK_EQ(discards.count(ANCHOR_MISSING), 1);
  CHECK_EQ(discards.events()[0].text, "<address>");

  // Recovery does not require a sink.
  recovery.RecoverAll(text, values, &candidates, nullptr);
  CHECK_EQ(candidates.size(), 2);
}

static void TestDeterminism() {
  SpanRecovery recovery(config);
  SourceText text("名前は田中です。電話は090-1111-2222です。");
  std::vector<TaggedValue> values = {
    TaggedValue("", "name", "名前は", "です"),
    TaggedValue("090-1111-2222", "phone-number", "電話は", "です"),
  };
  Candidates first;
  Candidates second;
  recovery.RecoverAll(text, values, &first, nullptr);
  recovery.RecoverAll(text, values, &second, nullptr);
  CHECK_EQ(first.size(), 2);
  CHECK_EQ(first.size(), second.size());
  for (int i = 0; i < first.size(); ++i) {
    CHECK_EQ(first[i].begin, second[i].begin);
    CHECK_EQ(first[i].end, second[i].end);
    CHECK_EQ(first[i].type, second[i].type);
  }
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);
  config = new ReconcilerConfig();
  CHECK(config->Init(ReconcilerOptions()));

  TestPointer();
  TestExactMatch();
  TestNormalizedMatch();
  TestUnrecognizedTag();
  TestAnchors();
  TestAmbiguous();
  TestMissingAnchors();
  TestSearchWindow();
  TestRecoverAll();
  TestDeterminism();

  delete config;
  std::cout << "PASS\n";
  return 0;
}
