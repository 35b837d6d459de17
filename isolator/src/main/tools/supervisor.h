/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_SUPERVISOR_H_
#define SRC_MAIN_TOOLS_SUPERVISOR_H_

#include "src/main/tools/error-handling.h"
#include "src/main/tools/sandbox-builder.h"
#include "src/main/tools/sandbox-request.h"

#include <functional>
#include <string>

// How a sandbox child ended, as seen from the parent.
struct ExitOutcome {
  // False when no child was ever created (invalid request, failed fork,
  // declined confirmation)
  bool launched = false;
  // True when the child ran to termination and was reaped
  bool exited = false;
  // Exit status of the child, 128 + signal when it was killed
  int exit_code = 0;
  // Terminating signal, 0 if the child exited normally
  int signal = 0;
  // Fatal error reported by the child (or by the parent before spawning)
  ErrorCode error = ErrorCode::None;
  // Last phase the child announced, or the phase it failed in. Execd only
  // when FilterLoaded was announced and the pipe then closed without an
  // error record; a child that died earlier keeps its last announced phase.
  BuildPhase last_phase = BuildPhase::Init;
  std::string error_msg;
};

// Forks a child running `body(status_fd)` and waits for it. The child writes
// ChildStatusRecords on `status_fd`: progress records with ErrorCode::None,
// then at most one error record. The descriptor is close-on-exec, so the
// pipe reaches EOF once every process holding it has exec'd or exited.
// `body` must not return.
ExitOutcome SpawnChildProcess(const std::function<void(int)>& body);

// Validates `request`, builds the sandbox in a child process and waits for the
// application to terminate.
ExitOutcome BuildAndLaunch(const SandboxRequest& request);

#endif  // SRC_MAIN_TOOLS_SUPERVISOR_H_
