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

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/types.h>
#include <unistd.h>
#include <string>

#include "redact/base/status.h"
#include "redact/base/types.h"
#include "redact/file/file.h"

namespace redact {

namespace {

Status IOError(const string &context, int error) {
  return Status(E_IO, context.c_str(), strerror(error));
}

int OpenFlags(const char *mode) {
  int flags = 0;
  switch (*mode++) {
    case 'r': flags = O_RDONLY; break;
    case 'w': flags = O_WRONLY | O_CREAT | O_TRUNC; break;
    case 'a': flags = O_WRONLY | O_CREAT | O_APPEND; break;
  }

  if (*mode == '+') {
    flags &= ~(O_RDONLY | O_WRONLY);
    flags |= O_RDWR;
  }

  return flags;
}

}  // namespace

// POSIX file interface.
class PosixFile : public File {
 public:
  PosixFile(int fd, const string &filename)
      : fd_(fd), filename_(filename) {}

  ~PosixFile() override {
    if (fd_ != -1) close(fd_);
  }

  Status Read(void *buffer, size_t size, uint64 *read) override {
    // Keep reading until the buffer is full or the end of file is reached.
    char *data = static_cast<char *>(buffer);
    uint64 total = 0;
    while (total < size) {
      ssize_t rc = ::read(fd_, data + total, size - total);
      if (rc < 0) {
        if (errno == EINTR) continue;
        return IOError(filename_, errno);
      }
      if (rc == 0) break;
      total += rc;
    }
    if (read != nullptr) *read = total;
    return Status::OK;
  }

  Status Write(const void *buffer, size_t size) override {
    const char *data = static_cast<const char *>(buffer);
    while (size > 0) {
      ssize_t rc = ::write(fd_, data, size);
      if (rc < 0) {
        if (errno == EINTR) continue;
        return IOError(filename_, errno);
      }
      data += rc;
      size -= rc;
    }
    return Status::OK;
  }

  Status Close() override {
    if (fd_ != -1) {
      if (close(fd_) != 0) {
        Status st = IOError(filename_, errno);
        fd_ = -1;
        delete this;
        return st;
      }
      fd_ = -1;
    }
    delete this;
    return Status::OK;
  }

  string filename() const override { return filename_; }

 private:
  // File descriptor.
  int fd_;

  // File name.
  string filename_;
};

Status File::Open(const string &name, const char *mode, File **f) {
  int fd = open(name.c_str(), OpenFlags(mode), 0644);
  if (fd == -1) return IOError(name, errno);
  *f = new PosixFile(fd, name);
  return Status::OK;
}

Status File::Delete(const string &name) {
  if (unlink(name.c_str()) != 0) return IOError(name, errno);
  return Status::OK;
}

}  // namespace redact
