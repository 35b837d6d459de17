/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/isolator-api.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <errno.h>
#include <stdio.h>
#include <sys/stat.h>


// The root filesystem itself is staged by the caller; only the directories
// every sandbox needs are created here.
static int CreateSkeleton(const std::string& sandbox_dir) {
  if (sandbox_dir.empty() || sandbox_dir[0] != '/') {
    return IsolatorReportErrorAndMessage(
        "sandbox directory must be an absolute path: " + sandbox_dir,
        ErrorCode::InvalidRequest);
  }

  const std::string usr_bin = sandbox_dir + "/usr/bin";
  if (CreateTarget(usr_bin.c_str(), true) < 0 && errno != EEXIST) {
    return IsolatorReportSysError(ErrorCode::InvalidRequest,
                                  "cannot create %s", usr_bin.c_str());
  }
  PRINT_DEBUG("sandbox skeleton ready in %s", sandbox_dir.c_str());
  return 0;
}


int CreateEnvironment(const SandboxRequest& request,
                      const std::function<bool()>& confirm,
                      ExitOutcome* outcome) {
  *outcome = ExitOutcome();

  if (CreateSkeleton(request.sandbox_dir) < 0) {
    outcome->error = static_cast<ErrorCode>(IsolatorGetErrorCode());
    outcome->error_msg = IsolatorGetErrorMsg();
    return UNRECOVERABLE_FAIL;
  }

  if (confirm && !confirm()) {
    PRINT_DEBUG("launch of %s declined", request.app_name.c_str());
    return 0;
  }

  *outcome = BuildAndLaunch(request);
  if (outcome->error != ErrorCode::None && !IsRecoverable(outcome->error)) {
    return UNRECOVERABLE_FAIL;
  }
  return 0;
}


int IsolatorEnableLog(const std::string& path) {
  if (global_debug != nullptr) {
    return IsolatorReportErrorAndMessage("a debug log is already enabled",
                                         ErrorCode::InvalidRequest);
  }

  const size_t slash = path.find_last_of('/');
  const std::string base_dir =
      (slash == std::string::npos) ? "." : path.substr(0, slash == 0 ? 1 : slash);
  struct stat sb;
  if (stat(base_dir.c_str(), &sb) < 0 || !S_ISDIR(sb.st_mode)) {
    return IsolatorReportErrorAndMessage(
        "log directory does not exist: " + base_dir,
        ErrorCode::InvalidRequest);
  }

  // Close-on-exec so the application never inherits the log.
  global_debug = fopen(path.c_str(), "we");
  if (global_debug == nullptr) {
    return IsolatorReportSysError(ErrorCode::InvalidRequest, "fopen(%s)",
                                  path.c_str());
  }
  logSystem();
  return 0;
}


int isolator_create_environment(const SandboxRequest& request,
                                const std::function<bool()>& confirm,
                                ExitOutcome* outcome) {
  return CreateEnvironment(request, confirm, outcome);
}


ExitOutcome isolator_build_and_launch(const SandboxRequest& request) {
  return BuildAndLaunch(request);
}


int isolator_enable_log(const std::string& path) {
  return IsolatorEnableLog(path);
}


int isolator_get_last_error_code() {
  return IsolatorGetErrorCode();
}


const char* isolator_get_last_error_msg() {
  return IsolatorGetErrorMsg();
}
