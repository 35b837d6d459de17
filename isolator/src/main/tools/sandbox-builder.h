/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_SANDBOX_BUILDER_H_
#define SRC_MAIN_TOOLS_SANDBOX_BUILDER_H_

#include "src/main/tools/error-handling.h"
#include "src/main/tools/sandbox-request.h"

#include <string>

#define DEFAULT_SANDBOX_PATH "/usr/local/bin:/usr/bin:/bin"

// Construction phases of the sandbox child, in the only order they may
// happen. Each phase is the postcondition of the step that enters it.
enum class BuildPhase : int {
  Init = 0,
  Unshared,
  IdentityMapped,
  MountsConfigured,
  RootSwitched,
  CapabilitiesDropped,
  NoNewPrivsSet,
  FilterLoaded,
  Execd
};

const char* BuildPhaseName(BuildPhase phase);

// Written by the sandbox child on its status pipe. A record with code
// ErrorCode::None announces that `phase` was reached; any other code is the
// fatal error that stopped the child in `phase`.
struct ChildStatusRecord {
  int code;
  int phase;
  char msg[MAX_ERR_LEN];
};

// Writes one ChildStatusRecord on `status_fd`. The record is smaller than
// PIPE_BUF, so writers sharing the pipe never interleave.
int SendStatusRecord(int status_fd, ErrorCode code, BuildPhase phase,
                     const char* msg);

// Drives the construction of one sandbox inside the calling process. Every
// step checks that the previous one completed and reports
// ErrorCode::IllegalTransition without touching the kernel otherwise, so the
// steps cannot run out of order.
class SandboxBuilder {
 public:
  explicit SandboxBuilder(SandboxRequest request);

  // Init -> Unshared
  int Unshare();
  // Unshared -> IdentityMapped
  int MapIdentity();
  // IdentityMapped -> MountsConfigured. Expects to run as PID 1 of the new
  // PID namespace, for /proc.
  int ConfigureMounts();
  // MountsConfigured -> RootSwitched
  int SwitchRoot();
  // RootSwitched -> CapabilitiesDropped
  int DropCapabilities();
  // CapabilitiesDropped -> NoNewPrivsSet
  int SetNoNewPrivs();
  // NoNewPrivsSet -> FilterLoaded
  int LoadFilter();
  // FilterLoaded -> Execd. Replaces the process image with the application and
  // only returns on failure (ErrorCode::Exec).
  int Exec();

  BuildPhase phase() const { return phase_; }
  const EnvironmentMap& environment() const { return env_; }
  const std::string& root() const { return root_; }

 private:
  int Expect(BuildPhase expected, const char* step);
  void Advance(BuildPhase next);

  const SandboxRequest request_;
  const std::string root_;
  BuildPhase phase_;
  // Environment of the application, share variables included
  EnvironmentMap env_;
};

// Looks `name` up in the colon separated `path_var` the way execvp(3) does.
int ResolveBinary(const std::string& name, const std::string& path_var,
                  std::string* resolved);

// Body of the sandbox child process. Runs every step in order and execs the
// application. Each completed step is announced on `status_fd`; a failure is
// written there as a ChildStatusRecord and the process exits with
// EXIT_FAILURE.
[[noreturn]] void RunSandboxChild(const SandboxRequest& request, int status_fd);

#endif  // SRC_MAIN_TOOLS_SANDBOX_BUILDER_H_
