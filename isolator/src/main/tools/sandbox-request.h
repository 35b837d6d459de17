/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_SANDBOX_REQUEST_H_
#define SRC_MAIN_TOOLS_SANDBOX_REQUEST_H_

#include <sys/types.h>

#include <map>
#include <set>
#include <string>
#include <vector>

// Variables handed to the application at exec time.
typedef std::map<std::string, std::string> EnvironmentMap;

// A host path made visible inside the new root before any share is applied.
struct BindRequest {
  std::string source;
  // Absolute path inside the sandbox
  std::string target;
  bool writable = false;
};

// Everything the sandbox construction needs. Owned by the caller and copied
// into the child.
struct SandboxRequest {
  // Binary to exec inside the sandbox, resolved through PATH
  std::string app_name;
  // Share tokens as the caller wrote them (home, wayland, x11, sound, tools).
  // Unknown tokens are reported and skipped when the mounts are applied.
  std::set<std::string> shares;
  // Pre-staged root of the sandbox. Absolute, existing and writable.
  std::string sandbox_dir;
  // Identity of the invoking user, mapped to 0 inside the sandbox and used to
  // locate its display and audio sockets
  uid_t host_uid = 0;
  gid_t host_gid = 0;
  std::string host_home;
  // Base environment of the application
  EnvironmentMap environment;
  std::vector<BindRequest> extra_binds;
};

// Fills a request for the calling user: its uid/gid, home directory and the
// current process environment.
SandboxRequest MakeSandboxRequest(const std::string& app_name,
                                  const std::set<std::string>& shares,
                                  const std::string& sandbox_dir);

EnvironmentMap CurrentEnvironment();

// Checks the preconditions of sandbox construction. Reports
// ErrorCode::InvalidRequest and returns a negative value on failure.
int ValidateSandboxRequest(const SandboxRequest& request);

#endif  // SRC_MAIN_TOOLS_SANDBOX_REQUEST_H_
