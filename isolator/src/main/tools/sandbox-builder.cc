/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/sandbox-builder.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/mounts.h"
#include "src/main/tools/namespaces.h"
#include "src/main/tools/privileges.h"
#include "src/main/tools/process-tools.h"
#include "src/main/tools/root-switch.h"

#include <errno.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <utility>
#include <vector>


const char* BuildPhaseName(BuildPhase phase) {
  switch (phase) {
    case BuildPhase::Init:
      return "Init";
    case BuildPhase::Unshared:
      return "Unshared";
    case BuildPhase::IdentityMapped:
      return "IdentityMapped";
    case BuildPhase::MountsConfigured:
      return "MountsConfigured";
    case BuildPhase::RootSwitched:
      return "RootSwitched";
    case BuildPhase::CapabilitiesDropped:
      return "CapabilitiesDropped";
    case BuildPhase::NoNewPrivsSet:
      return "NoNewPrivsSet";
    case BuildPhase::FilterLoaded:
      return "FilterLoaded";
    case BuildPhase::Execd:
      return "Execd";
  }
  return "Unknown";
}


static std::string StripTrailingSlashes(std::string path) {
  while (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }
  return path;
}


SandboxBuilder::SandboxBuilder(SandboxRequest request)
    : request_(std::move(request)),
      root_(StripTrailingSlashes(request_.sandbox_dir)),
      phase_(BuildPhase::Init),
      env_(request_.environment) {}


int SandboxBuilder::Expect(BuildPhase expected, const char* step) {
  if (phase_ != expected) {
    return IsolatorReportErrorAndMessage(
        std::string(step) + " needs phase " + BuildPhaseName(expected) +
            ", current phase is " + BuildPhaseName(phase_),
        ErrorCode::IllegalTransition);
  }
  return 0;
}


void SandboxBuilder::Advance(BuildPhase next) {
  PRINT_DEBUG("phase %s -> %s", BuildPhaseName(phase_), BuildPhaseName(next));
  phase_ = next;
}


int SandboxBuilder::Unshare() {
  if (Expect(BuildPhase::Init, "Unshare") < 0) {
    return UNRECOVERABLE_FAIL;
  }
  if (EnterNewNamespaces() < 0) {
    return UNRECOVERABLE_FAIL;
  }
  Advance(BuildPhase::Unshared);
  return 0;
}


int SandboxBuilder::MapIdentity() {
  if (Expect(BuildPhase::Unshared, "MapIdentity") < 0) {
    return UNRECOVERABLE_FAIL;
  }
  if (::MapIdentity(request_.host_uid, request_.host_gid) < 0) {
    return UNRECOVERABLE_FAIL;
  }
  if (SetupUtsNamespace() < 0) {
    return UNRECOVERABLE_FAIL;
  }
  Advance(BuildPhase::IdentityMapped);
  return 0;
}


int SandboxBuilder::ConfigureMounts() {
  if (Expect(BuildPhase::IdentityMapped, "ConfigureMounts") < 0) {
    return UNRECOVERABLE_FAIL;
  }
  if (PrepareMountNamespace(root_) < 0) {
    return UNRECOVERABLE_FAIL;
  }
  if (ApplyExtraBinds(root_, request_.extra_binds) < 0) {
    return UNRECOVERABLE_FAIL;
  }
  if (ApplyShares(root_, request_, &env_) < 0) {
    return UNRECOVERABLE_FAIL;
  }
  Advance(BuildPhase::MountsConfigured);
  return 0;
}


int SandboxBuilder::SwitchRoot() {
  if (Expect(BuildPhase::MountsConfigured, "SwitchRoot") < 0) {
    return UNRECOVERABLE_FAIL;
  }
  if (::SwitchRoot(root_) < 0) {
    return UNRECOVERABLE_FAIL;
  }
  if (MakeUsrReadOnly() < 0) {
    return UNRECOVERABLE_FAIL;
  }
  Advance(BuildPhase::RootSwitched);
  return 0;
}


int SandboxBuilder::DropCapabilities() {
  if (Expect(BuildPhase::RootSwitched, "DropCapabilities") < 0) {
    return UNRECOVERABLE_FAIL;
  }
  if (DropBoundingSet() < 0) {
    return UNRECOVERABLE_FAIL;
  }
  Advance(BuildPhase::CapabilitiesDropped);
  return 0;
}


int SandboxBuilder::SetNoNewPrivs() {
  if (Expect(BuildPhase::CapabilitiesDropped, "SetNoNewPrivs") < 0) {
    return UNRECOVERABLE_FAIL;
  }
  if (BlockPrivilegeEscalation() < 0) {
    return UNRECOVERABLE_FAIL;
  }
  Advance(BuildPhase::NoNewPrivsSet);
  return 0;
}


int SandboxBuilder::LoadFilter() {
  if (Expect(BuildPhase::NoNewPrivsSet, "LoadFilter") < 0) {
    return UNRECOVERABLE_FAIL;
  }
  if (LoadSyscallFilter() < 0) {
    return UNRECOVERABLE_FAIL;
  }
  Advance(BuildPhase::FilterLoaded);
  return 0;
}


static bool IsExecutableFile(const std::string& path) {
  struct stat sb;
  if (stat(path.c_str(), &sb) < 0) {
    return false;
  }
  if (!S_ISREG(sb.st_mode)) {
    errno = EACCES;
    return false;
  }
  return access(path.c_str(), X_OK) == 0;
}


int ResolveBinary(const std::string& name, const std::string& path_var,
                  std::string* resolved) {
  if (name.empty()) {
    errno = ENOENT;
    return -1;
  }
  if (name.find('/') != std::string::npos) {
    if (!IsExecutableFile(name)) {
      return -1;
    }
    *resolved = name;
    return 0;
  }

  // EACCES wins over ENOENT when a candidate exists but cannot run.
  int last_errno = ENOENT;
  size_t start = 0;
  while (start <= path_var.size()) {
    size_t end = path_var.find(':', start);
    if (end == std::string::npos) {
      end = path_var.size();
    }
    std::string dir = path_var.substr(start, end - start);
    if (dir.empty()) {
      dir = ".";
    }
    const std::string candidate = dir + "/" + name;
    if (IsExecutableFile(candidate)) {
      *resolved = candidate;
      return 0;
    }
    if (errno == EACCES) {
      last_errno = EACCES;
    }
    start = end + 1;
  }
  errno = last_errno;
  return -1;
}


int SandboxBuilder::Exec() {
  if (Expect(BuildPhase::FilterLoaded, "Exec") < 0) {
    return UNRECOVERABLE_FAIL;
  }

  std::string path_var = DEFAULT_SANDBOX_PATH;
  auto it = env_.find("PATH");
  if (it != env_.end() && !it->second.empty()) {
    path_var = it->second;
  }

  std::string binary;
  if (ResolveBinary(request_.app_name, path_var, &binary) < 0) {
    return IsolatorReportSysError(ErrorCode::Exec, "cannot find %s in %s",
                                  request_.app_name.c_str(), path_var.c_str());
  }

  std::vector<std::string> env_entries;
  env_entries.reserve(env_.size());
  for (const auto& entry : env_) {
    env_entries.push_back(entry.first + "=" + entry.second);
  }
  std::vector<char*> envp;
  for (std::string& entry : env_entries) {
    envp.push_back(&entry[0]);
  }
  envp.push_back(nullptr);

  std::string arg0 = request_.app_name;
  char* argv[] = {&arg0[0], nullptr};

  PRINT_DEBUG("execve(%s) with %zu variables", binary.c_str(),
              env_entries.size());
  execve(binary.c_str(), argv, envp.data());
  return IsolatorReportSysError(ErrorCode::Exec, "execve(%s)", binary.c_str());
}


int SendStatusRecord(int status_fd, ErrorCode code, BuildPhase phase,
                     const char* msg) {
  ChildStatusRecord record;
  memset(&record, 0, sizeof(record));
  record.code = static_cast<int>(code);
  record.phase = static_cast<int>(phase);
  strncpy(record.msg, msg, MAX_ERR_LEN - 1);

  ssize_t written =
      TEMP_FAILURE_RETRY(write(status_fd, &record, sizeof(record)));
  if (written != static_cast<ssize_t>(sizeof(record))) {
    PRINT_DEBUG("cannot send the status record: %s", strerror(errno));
    return UNRECOVERABLE_FAIL;
  }
  return 0;
}


// Sends the last error to the supervisor and leaves.
[[noreturn]] static void ReportFailure(BuildPhase phase, int status_fd) {
  const IsolatorError err = IsolatorGetLastError();
  SendStatusRecord(status_fd, err.code, phase, err.msg);
  fprintf(stderr, "%s\n", err.msg);
  _exit(EXIT_FAILURE);
}


typedef int (SandboxBuilder::*BuildStep)();

static void RunStep(SandboxBuilder* builder, BuildStep step, int status_fd) {
  if ((builder->*step)() < 0) {
    ReportFailure(builder->phase(), status_fd);
  }
  if (SendStatusRecord(status_fd, ErrorCode::None, builder->phase(), "") < 0) {
    IsolatorReportSysError(ErrorCode::GeneralOSError,
                           "cannot announce phase %s",
                           BuildPhaseName(builder->phase()));
    ReportFailure(builder->phase(), status_fd);
  }
}


void RunSandboxChild(const SandboxRequest& request, int status_fd) {
  ClearSignalMask();
  SandboxBuilder builder(request);

  RunStep(&builder, &SandboxBuilder::Unshare, status_fd);
  RunStep(&builder, &SandboxBuilder::MapIdentity, status_fd);

  // The unsharing process itself stays outside the new PID namespace; only
  // its next child becomes PID 1 there.
  const pid_t pid1 = fork();
  if (pid1 < 0) {
    IsolatorReportSysError(ErrorCode::Fork, "fork");
    ReportFailure(builder.phase(), status_fd);
  }
  if (pid1 > 0) {
    // status_fd stays open until PID 1 is reaped so a failure here still
    // reaches the supervisor.
    int status;
    if (WaitForProcess(pid1, &status) < 0) {
      IsolatorReportSysError(ErrorCode::GeneralOSError, "waitpid(%d)", pid1);
      ReportFailure(builder.phase(), status_fd);
    }
    close(status_fd);
    ExitLikeChild(status);
  }

  if (prctl(PR_SET_PDEATHSIG, SIGKILL) < 0) {
    IsolatorReportSysError(ErrorCode::Namespace, "prctl(PR_SET_PDEATHSIG)");
    ReportFailure(builder.phase(), status_fd);
  }

  RunStep(&builder, &SandboxBuilder::ConfigureMounts, status_fd);
  RunStep(&builder, &SandboxBuilder::SwitchRoot, status_fd);
  RunStep(&builder, &SandboxBuilder::DropCapabilities, status_fd);
  RunStep(&builder, &SandboxBuilder::SetNoNewPrivs, status_fd);
  RunStep(&builder, &SandboxBuilder::LoadFilter, status_fd);

  builder.Exec();
  ReportFailure(builder.phase(), status_fd);
}
