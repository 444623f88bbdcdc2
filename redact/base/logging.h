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

#ifndef REDACT_BASE_LOGGING_H_
#define REDACT_BASE_LOGGING_H_

#include <limits>
#include <sstream>

#include "redact/base/macros.h"
#include "redact/base/types.h"

namespace redact {

#ifndef LOG

const int INFO = 0;
const int WARNING = 1;
const int ERROR = 2;
const int FATAL = 3;
const int NUM_SEVERITIES = 4;

// A log sink receives all log messages that pass the severity threshold.
// Sinks are called synchronously from the logging thread and must be
// thread-safe if messages are logged from more than one thread.
class LogSink {
 public:
  virtual ~LogSink() = default;

  // Receive log message. The message does not include the log prefix.
  virtual void Send(int severity, const char *fname, int line,
                    const string &message) = 0;
};

class LogMessage : public std::basic_ostringstream<char> {
 public:
  LogMessage(const char *fname, int line, int severity);
  ~LogMessage();

  // Minimum severity for LOG statements.
  static int log_level();

  // Minimum log level for VLOG statements.
  static int vlog_level();

  // Install log sink. Messages are sent to the sink instead of being written
  // to stdout/stderr. Passing null restores the default output. Returns the
  // previous sink. The sink is not owned by the logging system.
  static LogSink *SetSink(LogSink *sink);

 protected:
  void GenerateLogMessage();

 private:
  const char *fname_;
  int line_;
  int severity_;
};

// LogMessageFatal ensures the process will exit in failure after
// logging this message.
class LogMessageFatal : public LogMessage {
 public:
  LogMessageFatal(const char *file, int line) REDACT_ATTRIBUTE_COLD;
  REDACT_ATTRIBUTE_NORETURN ~LogMessageFatal();
};

#define _LOG_INFO ::redact::LogMessage(__FILE__, __LINE__, ::redact::INFO)
#define _LOG_WARNING ::redact::LogMessage(__FILE__, __LINE__, ::redact::WARNING)
#define _LOG_ERROR ::redact::LogMessage(__FILE__, __LINE__, ::redact::ERROR)
#define _LOG_FATAL ::redact::LogMessageFatal(__FILE__, __LINE__)

#define LOG(severity) _LOG_##severity

// Get log level from --v flag.
#define VLOG_IS_ON(level) ((level) <= ::redact::LogMessage::vlog_level())

#define VLOG(level)                     \
  if (PREDICT_FALSE(VLOG_IS_ON(level))) \
    ::redact::LogMessage(__FILE__, __LINE__, ::redact::INFO)

// CHECK dies with a fatal error if condition is not true. It is not controlled
// by NDEBUG, so the check is executed regardless of compilation mode.
#define CHECK(condition)           \
  if (PREDICT_FALSE(!(condition))) \
  LOG(FATAL) << "Check failed: " #condition " "

// Allows static const integrals declared in classes to be used as arguments
// to CHECK* macros.
template <typename T>
inline const T &GetReferenceableValue(const T &t) { return t; }

inline int32 GetReferenceableValue(int32 t) { return t; }
inline int64 GetReferenceableValue(int64 t) { return t; }
inline uint32 GetReferenceableValue(uint32 t) { return t; }
inline uint64 GetReferenceableValue(uint64 t) { return t; }

// Formats a value for a failing CHECK_XX statement.
template <typename T>
inline void MakeCheckOpValueString(std::ostream *os, const T &v) { (*os) << v; }

// Readable values for unprintable characters.
template <>
void MakeCheckOpValueString(std::ostream *os, const char &v);

// Explicit specialization for std::nullptr_t.
template <>
void MakeCheckOpValueString(std::ostream *os, const std::nullptr_t &p);

// A string pointer which evaluates to true iff the pointer is non-null.
struct CheckOpString {
  CheckOpString(string *str) : str_(str) {}
  operator bool() const { return PREDICT_FALSE(str_ != nullptr); }
  string *str_;
};

// Builds "expr (V1 vs. V2)" messages for CHECK_XX statements.
class CheckOpMessageBuilder {
 public:
  explicit CheckOpMessageBuilder(const char *exprtext);
  ~CheckOpMessageBuilder();
  std::ostream *ForVar1() { return stream_; }
  std::ostream *ForVar2();
  string *NewString();

 private:
  std::ostringstream *stream_;
};

template <typename T1, typename T2>
string *MakeCheckOpString(const T1 &v1, const T2 &v2,
                          const char *exprtext) REDACT_ATTRIBUTE_NOINLINE;

template <typename T1, typename T2>
string *MakeCheckOpString(const T1 &v1, const T2 &v2, const char *exprtext) {
  CheckOpMessageBuilder comb(exprtext);
  MakeCheckOpValueString(comb.ForVar1(), v1);
  MakeCheckOpValueString(comb.ForVar2(), v2);
  return comb.NewString();
}

// Helper functions for CHECK_OP macro. The (size_t, int) and (int, size_t)
// overloads handle signed/unsigned comparisons of container sizes.
#define DEFINE_CHECK_OP_IMPL(name, op)                                    \
  template <typename T1, typename T2>                                     \
  inline string *name##Impl(const T1 &v1, const T2 &v2,                   \
                            const char *exprtext) {                       \
    if (PREDICT_TRUE(v1 op v2))                                           \
      return nullptr;                                                     \
    else                                                                  \
      return ::redact::MakeCheckOpString(v1, v2, exprtext);               \
  }                                                                       \
  inline string *name##Impl(int v1, int v2, const char *exprtext) {       \
    return name##Impl<int, int>(v1, v2, exprtext);                        \
  }                                                                       \
  inline string *name##Impl(const size_t v1, const int v2,                \
                            const char *exprtext) {                       \
    if (PREDICT_FALSE(v2 < 0)) {                                          \
       return ::redact::MakeCheckOpString(v1, v2, exprtext);              \
    }                                                                     \
    return name##Impl<size_t, size_t>(v1, v2, exprtext);                  \
  }                                                                       \
  inline string *name##Impl(const int v1, const size_t v2,                \
                            const char *exprtext) {                       \
    if (PREDICT_FALSE(v1 < 0)) {                                          \
       return ::redact::MakeCheckOpString(v1, v2, exprtext);              \
    }                                                                     \
    return name##Impl<size_t, size_t>(v1, v2, exprtext);                  \
  }

DEFINE_CHECK_OP_IMPL(EQ, == )
DEFINE_CHECK_OP_IMPL(NE, != )
DEFINE_CHECK_OP_IMPL(LE, <= )
DEFINE_CHECK_OP_IMPL(LT, < )
DEFINE_CHECK_OP_IMPL(GE, >= )
DEFINE_CHECK_OP_IMPL(GT, > )
#undef DEFINE_CHECK_OP_IMPL

#define CHECK_OP(name, op, val1, val2)                                \
  while (::redact::CheckOpString _result =                            \
             ::redact::name##Impl(                                    \
                 ::redact::GetReferenceableValue(val1),               \
                 ::redact::GetReferenceableValue(val2),               \
                 #val1 " " #op " " #val2))                            \
    ::redact::LogMessageFatal(__FILE__, __LINE__) << *(_result.str_)

#define CHECK_EQ(val1, val2) CHECK_OP(EQ, ==, val1, val2)
#define CHECK_NE(val1, val2) CHECK_OP(NE, !=, val1, val2)
#define CHECK_LE(val1, val2) CHECK_OP(LE, <=, val1, val2)
#define CHECK_LT(val1, val2) CHECK_OP(LT, <, val1, val2)
#define CHECK_GE(val1, val2) CHECK_OP(GE, >=, val1, val2)
#define CHECK_GT(val1, val2) CHECK_OP(GT, >, val1, val2)

#ifndef NDEBUG

#define DCHECK(condition) CHECK(condition)
#define DCHECK_EQ(val1, val2) CHECK_EQ(val1, val2)
#define DCHECK_NE(val1, val2) CHECK_NE(val1, val2)
#define DCHECK_LE(val1, val2) CHECK_LE(val1, val2)
#define DCHECK_LT(val1, val2) CHECK_LT(val1, val2)
#define DCHECK_GE(val1, val2) CHECK_GE(val1, val2)
#define DCHECK_GT(val1, val2) CHECK_GT(val1, val2)

#else

#define DCHECK(condition) while (false && (condition)) LOG(FATAL)

// The arguments are still parsed so errors and warnings are not lost.
#define _DCHECK_NOP(x, y) \
  while (false && ((void) (x), (void) (y), 0)) LOG(FATAL)

#define DCHECK_EQ(x, y) _DCHECK_NOP(x, y)
#define DCHECK_NE(x, y) _DCHECK_NOP(x, y)
#define DCHECK_LE(x, y) _DCHECK_NOP(x, y)
#define DCHECK_LT(x, y) _DCHECK_NOP(x, y)
#define DCHECK_GE(x, y) _DCHECK_NOP(x, y)
#define DCHECK_GT(x, y) _DCHECK_NOP(x, y)

#endif

#endif  // LOG

}  // namespace redact

#endif  // REDACT_BASE_LOGGING_H_
