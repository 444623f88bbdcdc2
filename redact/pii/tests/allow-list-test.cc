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

#include <stdlib.h>
#include <unistd.h>
#include <iostream>
#include <string>

#include "redact/base/init.h"
#include "redact/base/logging.h"
#include "redact/base/status.h"
#include "redact/file/file.h"
#include "redact/pii/allow-list.h"

using namespace redact;
using namespace redact::pii;

static string TempFile(const string &name) {
  const char *tmpdir = getenv("TMPDIR");
  if (tmpdir == nullptr) tmpdir = "/tmp";
  return string(tmpdir) + "/allow-list-test-" +
         std::to_string(getpid()) + "-" + name;
}

static const char *kDictionary =
    "# Technology terms\n"
    "Python\n"
    "AI/alias[AI|Artificial Intelligence]\n"
    "node.js/js[node]\n"
    "\n"
    "  Kubernetes  \n";

static void TestDictionary() {
  AllowList allow;
  CHECK(allow.empty());
  CHECK(!allow.Contains("Python"));

  CHECK_EQ(allow.AddDictionary(kDictionary), 7);
  CHECK_EQ(allow.size(), 6);
  CHECK(allow.Contains("Python"));
  CHECK(allow.Contains("AI"));
  CHECK(allow.Contains("Artificial Intelligence"));
  CHECK(allow.Contains("node.js"));
  CHECK(allow.Contains("node"));
  CHECK(allow.Contains("Kubernetes"));
  CHECK(!allow.Contains("Java"));
  CHECK(!allow.Contains("AI/alias[AI|Artificial Intelligence]"));
  CHECK(!allow.Contains(""));
}

static void TestNormalizedMatch() {
  AllowList allow;
  allow.Add("Artificial Intelligence");
  allow.Add("");
  CHECK_EQ(allow.size(), 1);
  CHECK(allow.Contains("artificial intelligence"));
  CHECK(allow.Contains("ARTIFICIAL  INTELLIGENCE"));
  CHECK(allow.Contains("Artificial\nIntelligence"));
  CHECK(!allow.Contains("Artificial"));
}

static void TestLoad() {
  string filename = TempFile("dict");
  CHECK(File::WriteContents(filename, kDictionary));
  AllowList allow;
  CHECK(allow.LoadDictionary(filename));
  CHECK_EQ(allow.size(), 6);
  CHECK(File::Delete(filename));

  Status st = allow.LoadDictionary(filename);
  CHECK_EQ(st.code(), E_IO);
  CHECK_EQ(allow.size(), 6);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestDictionary();
  TestNormalizedMatch();
  TestLoad();

  std::cout << "PASS\n";
  return 0;
}
