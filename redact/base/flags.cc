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

#include "redact/base/flags.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <iostream>
#include <vector>

#include "redact/base/logging.h"

DEFINE_bool(help, false, "Print help message");
DEFINE_string(flagfile, "", "File with additional --name=value flags");

namespace redact {

// Global list of command line flags.
Flag *Flag::head = nullptr;
Flag *Flag::tail = nullptr;

// Program usage message.
static string usage_message;

// Flag type names.
static const char *flagtype[] = {
  "bool", "int32", "uint32", "int64", "uint64", "double", "string",
};

Flag::Flag(const char *name, Type type, const char *help,
           const char *filename, void *storage)
    : name(name), type(type), help(help), filename(filename), storage(storage) {
  // Link flag into flags list.
  if (head == nullptr) {
    head = tail = this;
  } else {
    tail->next = this;
    tail = this;
  }
  next = nullptr;
}

Flag *Flag::Find(const char *name) {
  Flag *f = head;
  while (f != nullptr) {
    if (strcmp(name, f->name) == 0) return f;
    f = f->next;
  }
  return nullptr;
}

void Flag::SetUsageMessage(const string &usage) {
  usage_message = usage;
}

// Split argument into a flag name and flag value (or null if they are
// missing).
static bool SplitArgument(char *arg, const char **name, const char **value) {
  *name = nullptr;
  *value = nullptr;

  // Return false if argument is not a flag.
  if (arg == nullptr || arg[0] != '-') return false;

  // Find the begin of the flag name.
  arg++;
  if (*arg == '-') {
    arg++;
    if (arg[0] == '\0') return true;
  }
  *name = arg;

  // Find the end of the flag name and NUL-terminate it.
  while (*arg != '\0' && *arg != '=') arg++;
  if (*arg == '=') {
    *arg = 0;
    *value = arg + 1;
  }

  return true;
}

// Look up flag, trying to remove a "no" prefix for negated booleans.
static Flag *LookupFlag(const char *name, bool *neg) {
  *neg = false;
  Flag *flag = Flag::Find(name);
  if (flag == nullptr && name[0] == 'n' && name[1] == 'o') {
    flag = Flag::Find(name + 2);
    if (flag != nullptr) *neg = true;
  }
  return flag;
}

bool Flag::Set(const char *text, bool negated) {
  // Parse boolean flag value.
  if (type == BOOL) {
    if (negated || text == nullptr) {
      value<bool>() = !negated;
      return true;
    }
    static const char *trueval[]  = {"1", "t", "true", "y", "yes"};
    static const char *falseval[] = {"0", "f", "false", "n", "no"};
    static_assert(sizeof(trueval) == sizeof(falseval), "true/false values");
    for (size_t i = 0; i < sizeof(trueval) / sizeof(*trueval); ++i) {
      if (strcasecmp(text, trueval[i]) == 0) {
        value<bool>() = true;
        return true;
      } else if (strcasecmp(text, falseval[i]) == 0) {
        value<bool>() = false;
        return true;
      }
    }
    return false;
  }
  if (text == nullptr) return false;

  char *endptr = nullptr;
  switch (type) {
    case INT32:
      value<int32>() = strtol(text, &endptr, 10);
      break;
    case UINT32:
      value<uint32>() = strtoul(text, &endptr, 10);
      break;
    case INT64:
      value<int64_t>() = strtoll(text, &endptr, 10);
      break;
    case UINT64:
      value<uint64_t>() = strtoull(text, &endptr, 10);
      break;
    case DOUBLE:
      value<double>() = strtod(text, &endptr);
      break;
    case STRING:
      value<string>() = text;
      break;
    case BOOL:
      break;
  }
  return endptr == nullptr || *endptr == '\0';
}

int Flag::ParseCommandLineFlags(int *argc, char **argv) {
  int rc = 0;
  for (int i = 1; i < *argc;) {
    int j = i;
    char *arg = argv[i++];

    // Split arg into flag components.
    const char *name;
    const char *value;
    if (!SplitArgument(arg, &name, &value)) continue;

    // Stop parsing argument if -- is seen.
    if (name == nullptr) break;

    // Look up the flag.
    bool neg;
    Flag *flag = LookupFlag(name, &neg);
    if (flag == nullptr) {
      std::cerr << "Error: unrecognized flag " << arg << "\n"
                << "Try --help for options\n";
      rc = j;
      break;
    }

    // If we still need a flag value, use the next argument if available.
    if (value == nullptr && flag->type != BOOL) {
      if (i < *argc) value = argv[i++];
      if (value == nullptr) {
        std::cerr << "Error: missing value for flag " << arg << " of type "
                  << flagtype[flag->type] << "\n";
        rc = j;
        break;
      }
    }

    if (!flag->Set(value, neg)) {
      std::cerr << "Error: illegal value for flag " << arg << " of type "
                << flagtype[flag->type] << "\nTry --help for options\n";
      rc = j;
      break;
    }

    // Flags from a flag file are applied right away so that later command
    // line flags override them.
    if (flag->storage == &FLAGS_flagfile && !FLAGS_flagfile.empty()) {
      if (!ParseFlagFile(FLAGS_flagfile)) {
        rc = j;
        break;
      }
    }

    // Remove the flag and value from the command.
    while (j < i) argv[j++] = nullptr;
  }

  // Shrink the argument list.
  int j = 1;
  for (int i = 1; i < *argc; i++) {
    if (argv[i] != nullptr) argv[j++] = argv[i];
  }
  *argc = j;

  if (FLAGS_help) {
    PrintHelp();
    exit(0);
  }

  return rc;
}

bool Flag::ParseFlagFile(const string &filename) {
  FILE *f = fopen(filename.c_str(), "r");
  if (f == nullptr) {
    std::cerr << "Error: cannot open flag file " << filename << "\n";
    return false;
  }

  bool ok = true;
  char line[4096];
  int lineno = 0;
  while (fgets(line, sizeof(line), f) != nullptr) {
    lineno++;

    // Strip trailing newline and whitespace.
    size_t len = strlen(line);
    while (len > 0 && (line[len - 1] == '\n' || line[len - 1] == '\r' ||
                       line[len - 1] == ' ' || line[len - 1] == '\t')) {
      line[--len] = 0;
    }
    char *arg = line;
    while (*arg == ' ' || *arg == '\t') arg++;
    if (*arg == 0 || *arg == '#') continue;

    const char *name;
    const char *value;
    bool neg;
    Flag *flag = nullptr;
    if (SplitArgument(arg, &name, &value) && name != nullptr) {
      flag = LookupFlag(name, &neg);
    }
    if (flag == nullptr || flag->storage == &FLAGS_flagfile ||
        !flag->Set(value, neg)) {
      std::cerr << "Error: invalid flag in " << filename << ":" << lineno
                << ": " << line << "\n";
      ok = false;
      break;
    }
  }

  fclose(f);
  return ok;
}

std::ostream &operator<<(std::ostream &os, const Flag &flag) {
  switch (flag.type) {
    case Flag::BOOL:
      os << (flag.value<bool>() ? "true" : "false");
      break;
    case Flag::INT32:
      os << flag.value<int32>();
      break;
    case Flag::UINT32:
      os << flag.value<uint32>();
      break;
    case Flag::INT64:
      os << flag.value<int64_t>();
      break;
    case Flag::UINT64:
      os << flag.value<uint64_t>();
      break;
    case Flag::DOUBLE:
      os << flag.value<double>();
      break;
    case Flag::STRING:
      os << flag.value<string>();
      break;
  }

  return os;
}

void Flag::PrintHelp() {
  if (!usage_message.empty()) {
    std::cout << usage_message << "\n";
  }
  if (head != nullptr) {
    std::cout << "Options:\n";
    Flag *f = head;
    while (f != nullptr) {
      std::cout << "  --" << f->name << " (" << f->help << ")\n"
         << "        type: " << flagtype[f->type] << "  default: " << *f
         << "\n";
      f = f->next;
    }
  }
}

}  // namespace redact
