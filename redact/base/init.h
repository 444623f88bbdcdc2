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

#ifndef REDACT_BASE_INIT_H_
#define REDACT_BASE_INIT_H_

namespace redact {

// Initialize program. This parses the command line flags and removes them
// from the argument list, leaving only positional arguments. The program
// exits on malformed flags.
void InitProgram(int *argc, char **argv[]);

// Initialize program with a usage line shown by --help.
void InitProgram(int *argc, char **argv[], const char *usage);

}  // namespace redact

#endif  // REDACT_BASE_INIT_H_
