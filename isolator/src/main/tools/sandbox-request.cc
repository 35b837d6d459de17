/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/sandbox-request.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <unistd.h>

extern char **environ;


EnvironmentMap CurrentEnvironment() {
  EnvironmentMap env;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    std::string line(*entry);
    const auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos || eq_pos == 0)
      continue;
    env.emplace(line.substr(0, eq_pos), line.substr(eq_pos + 1));
  }
  return env;
}


SandboxRequest MakeSandboxRequest(const std::string& app_name,
                                  const std::set<std::string>& shares,
                                  const std::string& sandbox_dir) {
  SandboxRequest request;
  request.app_name = app_name;
  request.shares = shares;
  request.sandbox_dir = sandbox_dir;
  request.host_uid = getuid();
  request.host_gid = getgid();
  request.host_home = GetHomeDir();
  request.environment = CurrentEnvironment();
  return request;
}


int ValidateSandboxRequest(const SandboxRequest& request) {
  if (request.app_name.empty()) {
    return IsolatorReportErrorAndMessage("No application specified",
                                         ErrorCode::InvalidRequest);
  }

  const std::string& dir = request.sandbox_dir;
  if (dir.empty() || dir[0] != '/') {
    return IsolatorReportErrorAndMessage(
        "Sandbox directory must be an absolute path: " + dir,
        ErrorCode::InvalidRequest);
  }

  std::error_code ec;
  if (!fs::is_directory(fs::path(dir), ec) || ec) {
    return IsolatorReportErrorAndMessage(
        "Sandbox directory does not exist: " + dir, ErrorCode::InvalidRequest);
  }

  if (access(dir.c_str(), W_OK) < 0) {
    return IsolatorReportSysError(ErrorCode::InvalidRequest,
                                  "Sandbox directory %s is not writable",
                                  dir.c_str());
  }

  for (const BindRequest& bind : request.extra_binds) {
    if (bind.source.empty() || bind.source[0] != '/' ||
        bind.target.empty() || bind.target[0] != '/') {
      return IsolatorReportErrorAndMessage(
          "Bind mounts need absolute paths: " + bind.source + " -> " +
              bind.target,
          ErrorCode::InvalidRequest);
    }
  }
  return 0;
}
