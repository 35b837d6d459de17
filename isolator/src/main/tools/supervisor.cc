/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/supervisor.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <errno.h>
#include <fcntl.h>
#include <stdlib.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>


static ExitOutcome FailedBeforeLaunch() {
  ExitOutcome outcome;
  outcome.error = static_cast<ErrorCode>(IsolatorGetErrorCode());
  outcome.error_msg = IsolatorGetErrorMsg();
  return outcome;
}


// Reads one status record. Returns the number of bytes read: 0 when the pipe
// was closed, sizeof(*record) when a whole record arrived.
static ssize_t ReadStatusRecord(int fd, ChildStatusRecord* record) {
  char* buf = reinterpret_cast<char*>(record);
  size_t total = 0;
  while (total < sizeof(*record)) {
    ssize_t n = TEMP_FAILURE_RETRY(read(fd, buf + total,
                                        sizeof(*record) - total));
    if (n < 0) {
      return -1;
    }
    if (n == 0) {
      break;
    }
    total += n;
  }
  return total;
}


ExitOutcome SpawnChildProcess(const std::function<void(int)>& body) {
  int status_pipe[2];
  if (pipe2(status_pipe, O_CLOEXEC) < 0) {
    IsolatorReportSysError(ErrorCode::Fork, "pipe2");
    return FailedBeforeLaunch();
  }

  // Nothing buffered may be flushed twice.
  fflush(stdout);
  fflush(stderr);
  if (global_debug != nullptr) {
    fflush(global_debug);
  }

  const pid_t child_pid = fork();
  if (child_pid < 0) {
    IsolatorReportSysError(ErrorCode::Fork, "fork");
    close(status_pipe[0]);
    close(status_pipe[1]);
    return FailedBeforeLaunch();
  }

  if (child_pid == 0) {
    close(status_pipe[0]);
    body(status_pipe[1]);
    // body is not supposed to come back
    _exit(EXIT_FAILURE);
  }

  PRINT_DEBUG("sandbox child has PID %d", child_pid);
  close(status_pipe[1]);

  ExitOutcome outcome;
  outcome.launched = true;

  // Progress records carry ErrorCode::None; the first error record is final.
  ChildStatusRecord record;
  bool failed = false;
  for (;;) {
    memset(&record, 0, sizeof(record));
    const ssize_t got = ReadStatusRecord(status_pipe[0], &record);
    if (got < 0) {
      PRINT_WARNING("cannot read the sandbox status: %s", strerror(errno));
      break;
    }
    if (got != static_cast<ssize_t>(sizeof(record))) {
      if (got > 0) {
        PRINT_WARNING("truncated sandbox status record (%zd bytes)", got);
      }
      break;
    }
    record.msg[MAX_ERR_LEN - 1] = '\0';
    if (failed) {
      continue;
    }
    outcome.last_phase = static_cast<BuildPhase>(record.phase);
    if (record.code != static_cast<int>(ErrorCode::None)) {
      failed = true;
      outcome.error = static_cast<ErrorCode>(record.code);
      outcome.error_msg = record.msg;

      IsolatorError err;
      memset(&err, 0, sizeof(err));
      err.code = outcome.error;
      memcpy(err.msg, record.msg, MAX_ERR_LEN);
      IsolatorSetLastError(err);
    }
  }
  close(status_pipe[0]);

  // Every step up to the filter completed and the pipe closed without an
  // error, so execve succeeded.
  if (!failed && outcome.last_phase == BuildPhase::FilterLoaded) {
    outcome.last_phase = BuildPhase::Execd;
  }

  int status;
  if (WaitForProcess(child_pid, &status) < 0) {
    IsolatorReportSysError(ErrorCode::GeneralOSError, "waitpid(%d)",
                           child_pid);
    if (outcome.error == ErrorCode::None) {
      outcome.error = ErrorCode::GeneralOSError;
      outcome.error_msg = IsolatorGetErrorMsg();
    }
    return outcome;
  }

  outcome.exited = true;
  if (WIFSIGNALED(status)) {
    outcome.signal = WTERMSIG(status);
    outcome.exit_code = 128 + outcome.signal;
    PRINT_DEBUG("child exited due to receiving signal: %s",
                strsignal(outcome.signal));
  } else {
    outcome.exit_code = WEXITSTATUS(status);
    PRINT_DEBUG("child exited normally with code %d", outcome.exit_code);
  }
  return outcome;
}


ExitOutcome BuildAndLaunch(const SandboxRequest& request) {
  if (ValidateSandboxRequest(request) < 0) {
    return FailedBeforeLaunch();
  }

  PRINT_DEBUG("launching %s in %s", request.app_name.c_str(),
              request.sandbox_dir.c_str());
  return SpawnChildProcess([&request](int status_fd) {
    RunSandboxChild(request, status_fd);
  });
}
