// Copyright 2015 The Bazel Authors. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SRC_MAIN_TOOLS_PROCESS_TOOLS_H_
#define SRC_MAIN_TOOLS_PROCESS_TOOLS_H_

#include <errno.h>
#include <stdbool.h>
#include <sys/types.h>
#include <string>
#include <vector>

#if __has_include(<filesystem>)
#include <filesystem>
namespace fs = std::filesystem;
#else
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#define _EXPERIMENTAL_FILESYSTEM_
#endif

#ifndef TEMP_FAILURE_RETRY
// Some C standard libraries like musl do not define this macro, so we'll
// include our own version for compatibility.
#define TEMP_FAILURE_RETRY(exp)                                                \
  ({                                                                           \
    decltype(exp) _rc;                                                         \
    do {                                                                       \
      _rc = (exp);                                                             \
    } while (_rc == -1 && errno == EINTR);                                     \
    _rc;                                                                       \
  })
#endif // TEMP_FAILURE_RETRY

struct utsname;

// Set up a signal handler for a signal.
void InstallSignalHandler(int signum, void (*handler)(int));

// Set the signal handler for `signum` to SIG_IGN (ignore).
void IgnoreSignal(int signum);

// Set the signal handler for `signum` to SIG_DFL (default).
void InstallDefaultSignalHandler(int sig);

// Use an empty signal mask for the process and set all signal handlers to their
// default.
void ClearSignalMask();

// Write contents to a file. Returns -1 with errno set if the file cannot be
// opened or written.
int WriteFile(const std::string &filename, const char *fmt, ...)
    __attribute__((format(printf, 2, 3)));

// Reads the first line of a file, without the trailing newline.
int ReadFirstLine(const std::string &filename, std::string &out);

// Recursively creates the file or directory specified in "path" and its parent
// directories.
// Return -1 on failure and sets errno to:
//    EINVAL   path is null
//    ENOTDIR  path exists and is not a directory
//    EEXIST   path exists and is a directory
//    ENOENT   stat call with the path failed
int CreateTarget(const char *path, bool is_directory);

// Waits for `pid` to terminate, restarting on EINTR, and stores its wait
// status.
int WaitForProcess(pid_t pid, int *status);

// Leaves the current process the same way a child with wait status `status`
// left: with the same exit code, or by re-raising the same signal.
[[noreturn]] void ExitLikeChild(int status);

int CountMounts();
std::string GetHomeDir();

bool GetOSName(std::string& printable_name, std::string& version_id);
bool GetKernelInfo(struct utsname* buf);
bool UserNamespaceSupported();


enum UserNamespaceSupport {
    NON_INIT,
    USER_NS_SUPPORTED,
    USER_NS_NOT_SUPPORTED
};

#endif  // SRC_MAIN_TOOLS_PROCESS_TOOLS_H_
