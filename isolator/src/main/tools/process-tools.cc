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

#include "src/main/tools/process-tools.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/error-handling.h"

#include <mntent.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <libgen.h>
#include <pwd.h>
#include <sched.h>
#include <signal.h>
#include <stdarg.h>
#include <stdio.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/utsname.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <string>
#include <vector>

static UserNamespaceSupport user_ns_support = NON_INIT;

void InstallSignalHandler(int signum, void (*handler)(int)) {
  struct sigaction sa = {};
  sa.sa_handler = handler;
  if (handler == SIG_IGN || handler == SIG_DFL) {
    // No point in blocking signals when using the default handler or ignoring
    // the signal.
    if (sigemptyset(&sa.sa_mask) < 0) {
      IsolatorReportGenericError("sigemptyset");
    }
  } else {
    // When using a custom handler, block all signals from firing while the
    // handler is running.
    if (sigfillset(&sa.sa_mask) < 0) {
      IsolatorReportGenericError("sigfillset");
    }
  }
  // sigaction may fail for certain reserved signals. Ignore failure in this
  // case, but report it in debug mode, just in case.
  if (sigaction(signum, &sa, nullptr) < 0) {
    PRINT_DEBUG("sigaction(%d, &sa, nullptr) failed", signum);
  }
}

void IgnoreSignal(int signum) {
  // These signals can't be handled, so we'll just not do anything for these.
  if (signum != SIGSTOP && signum != SIGKILL) {
    InstallSignalHandler(signum, SIG_IGN);
  }
}

void InstallDefaultSignalHandler(int signum) {
  // These signals can't be handled, so we'll just not do anything for these.
  if (signum != SIGSTOP && signum != SIGKILL) {
    InstallSignalHandler(signum, SIG_DFL);
  }
}


void ClearSignalMask() {
  // Use an empty signal mask for the process.
  sigset_t empty_sset;
  if (sigemptyset(&empty_sset) < 0) {
    IsolatorReportGenericError("sigemptyset");
  }
  if (sigprocmask(SIG_SETMASK, &empty_sset, nullptr) < 0) {
    IsolatorReportGenericError("sigprocmask");
  }

  // Set the default signal handler for all signals.
  for (int i = 1; i < NSIG; ++i) {
    if (i == SIGKILL || i == SIGSTOP) {
      continue;
    }

    struct sigaction sa = {};
    sa.sa_handler = SIG_DFL;
    if (sigemptyset(&sa.sa_mask) < 0) {
      IsolatorReportGenericError("sigemptyset");
    }
    // Ignore possible errors, because we might not be allowed to set the
    // handler for certain signals, but we still want to try.
    sigaction(i, &sa, nullptr);
  }
}

// Write contents to a file.
int WriteFile(const std::string &filename, const char *fmt, ...) {
  FILE *stream = fopen(filename.c_str(), "w");
  if (stream == nullptr) {
    return -1;
  }

  va_list ap;
  va_start(ap, fmt);
  int r = vfprintf(stream, fmt, ap);
  va_end(ap);

  if (r < 0) {
    int saved_errno = errno;
    fclose(stream);
    errno = saved_errno;
    return -1;
  }

  // Files under /proc only validate what was written when the buffer is
  // flushed, so the error surfaces here.
  if (fclose(stream) != 0) {
    return -1;
  }
  return 0;
}


int ReadFirstLine(const std::string &filename, std::string &out) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    return -1;
  }
  if (!std::getline(file, out)) {
    return -1;
  }
  return 0;
}


static int CreateFile(const char *path) {
  int handle = open(path, O_CREAT | O_WRONLY | O_EXCL | O_CLOEXEC, 0666);
  if (handle < 0) {
    return -1;
  }
  if (close(handle) < 0) {
    return -1;
  }
  return 0;
}


int CreateTarget(const char *path, bool is_directory) {
  if (path == NULL) {
    errno = EINVAL;
    return -1;
  }

  struct stat sb;
  // If the path already exists...
  if (stat(path, &sb) == 0) {
    if (is_directory && S_ISDIR(sb.st_mode)) {
      // and it's a directory and supposed to be a directory, we're done here.
      return 0;
    } else if (!is_directory && !S_ISDIR(sb.st_mode)) {
      // and it's a file and supposed to be one, we're done here.
      return 0;
    } else {
      // otherwise something is really wrong.
      errno = is_directory ? ENOTDIR : EEXIST;
      return -1;
    }
  } else {
    // If stat failed because of any error other than "the path does not exist",
    // this is an error.
    if (errno != ENOENT) {
      return -1;
    }
  }

  // Create the parent directory.
  {
    std::vector<char> buf(path, path + strlen(path) + 1);
    char *dir = dirname(buf.data());
    if (CreateTarget(dir, true) < 0) {
      return -1;
    }
  }

  if (is_directory) {
    if (mkdir(path, 0755) < 0 && errno != EEXIST) {
      return -1;
    }
    return 0;
  }
  return CreateFile(path);
}


int WaitForProcess(pid_t pid, int *status) {
  const pid_t ret = TEMP_FAILURE_RETRY(waitpid(pid, status, 0));
  if (ret < 0) {
    return -1;
  }
  return 0;
}


void ExitLikeChild(int status) {
  if (WIFEXITED(status)) {
    _exit(WEXITSTATUS(status));
  }

  if (WIFSIGNALED(status)) {
    const int signal = WTERMSIG(status);
    InstallDefaultSignalHandler(signal);
    sigset_t sset;
    sigemptyset(&sset);
    sigaddset(&sset, signal);
    sigprocmask(SIG_UNBLOCK, &sset, nullptr);
    raise(signal);
    // Only reached for signals whose default action is not to terminate.
    _exit(128 + signal);
  }

  _exit(EXIT_FAILURE);
}


int CountMounts() {
  FILE* fp = setmntent("/proc/self/mounts", "r");
  if (!fp) return -1;

  int count = 0;
  while (getmntent(fp)) {
    ++count;
  }

  endmntent(fp);
  return count;
}


std::string GetHomeDir() {
  const char* home = std::getenv("HOME");
  if (home != nullptr && home[0] != '\0') {
    return std::string(home);
  }
  struct passwd* pwd = getpwuid(getuid());
  if (pwd != nullptr && pwd->pw_dir != nullptr) {
    return std::string(pwd->pw_dir);
  }
  return "";
}


static inline void trim(std::string& s) {
  auto is_not_space = [](unsigned char ch) { return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), is_not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), is_not_space).base(), s.end());
}

// Remove surrounding single or double quotes if present
static inline void unquote(std::string& s) {
  if (s.size() >= 2 &&
      ((s.front() == '"' && s.back() == '"') ||
       (s.front() == '\'' && s.back() == '\''))) {
    s = s.substr(1, s.size() - 2);
  }
}

// Parses /etc/os-release and returns NAME and VERSION_ID via out-params.
// Returns true iff at least one of the requested keys was found.
bool GetOSName(std::string& printable_name, std::string& version_id) {
  printable_name.clear();
  version_id.clear();

  std::ifstream file("/etc/os-release");
  if (!file.is_open()) {
    return false;
  }

  std::string line;
  while (std::getline(file, line)) {
    if (line.empty() || line[0] == '#') continue;

    const auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) continue;

    std::string key = line.substr(0, eq_pos);
    std::string value = line.substr(eq_pos + 1);

    trim(key);
    trim(value);
    unquote(value);

    if (key == "NAME") {
      printable_name = value;
    } else if (key == "VERSION_ID") {
      version_id = value;
    }

    if (!printable_name.empty() && !version_id.empty()) {
      break;
    }
  }
  return (!printable_name.empty() || !version_id.empty());
}


bool GetKernelInfo(struct utsname* buf) {
  return (uname(buf) == 0);
}


static bool HasUserNamespaceSupport() {
  static const char* const paths[] = {
      "/proc/self/ns/user",
      "/proc/self/ns/pid",
      "/proc/self/ns/net",
      "/proc/self/ns/mnt",
      "/proc/self/ns/uts",
      "/proc/self/ns/ipc",
  };

  for (const char* p : paths) {
    if (access(p, F_OK) == -1) {
      return false;
    }
  }
  return true;
}

// Code heavily inspired by
//https://github.com/mozilla-firefox/firefox/blob/131497bb1b747587b2b21b1abf14f44ecffad805/security/sandbox/linux/SandboxInfo.cpp
static bool CanCreateUserNamespace() {
  pid_t pid = static_cast<pid_t>(
      syscall(__NR_clone, SIGCHLD | CLONE_NEWUSER,
              nullptr, nullptr, nullptr, nullptr));

  if (pid == 0) {
    int rv = unshare(CLONE_NEWPID);
    _exit(rv == 0 ? 0 : 1);
  }

  if (pid == -1) {
    return false;
  }

  int status = 0;
  if (WaitForProcess(pid, &status) < 0) {
    return false;
  }

  return (WIFEXITED(status) && WEXITSTATUS(status) == 0);
}


bool UserNamespaceSupported() {
  bool res = false;
  if (user_ns_support != NON_INIT)
    res = (user_ns_support == USER_NS_SUPPORTED);
  else if (std::getenv("ISOLATOR_FORCE_USER_NAMESPACE") != nullptr)
    res = true;
  else {
    res = HasUserNamespaceSupport() && CanCreateUserNamespace();
    user_ns_support = (res) ? USER_NS_SUPPORTED : USER_NS_NOT_SUPPORTED;
  }
  return res;
}
