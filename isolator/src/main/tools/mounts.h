/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_MOUNTS_H_
#define SRC_MAIN_TOOLS_MOUNTS_H_

#include "src/main/tools/error-handling.h"
#include "src/main/tools/sandbox-request.h"

#include <string>
#include <vector>

enum class ShareKind { Home, Wayland, X11, Sound, Tools };

// One mount to perform inside the new root.
struct MountSpec {
  std::string source;
  // Relative to the new root, always starting with '/'
  std::string target;
  unsigned long flags = 0;
  // Empty for bind mounts
  std::string fstype;
};

// Host binary made available by the "tools" share.
#define TOOLS_SHARE_BINARY "/usr/bin/git"

bool ParseShareKind(const std::string& token, ShareKind* kind);
const char* ShareKindName(ShareKind kind);

// Where the share comes from on the host, where it lands in the sandbox and
// which variables the application needs to find it. Touches nothing.
MountSpec PlanShare(ShareKind kind, const SandboxRequest& request,
                    EnvironmentMap* env);

// Makes the mount tree private, turns `new_root` into a mount point and
// mounts a fresh /proc, a minimal /dev and an empty /tmp inside it.
int PrepareMountNamespace(const std::string& new_root);

// Bind-mounts the caller's extra host paths into `new_root`, read-only unless
// marked writable.
int ApplyExtraBinds(const std::string& new_root,
                    const std::vector<BindRequest>& binds);

// Bind-mounts every recognized share of `request` into `new_root` and records
// the variables they need in `env`. Unknown tokens are reported as
// ErrorCode::UnknownShare and skipped; a failed bind is ErrorCode::Mount.
int ApplyShares(const std::string& new_root, const SandboxRequest& request,
                EnvironmentMap* env);

// Remounts an existing mount point read-only, keeping the flags the kernel
// would refuse to clear from inside a user namespace. Failures are reported
// with `code`.
int RemountReadOnly(const std::string& path, ErrorCode code);

#endif  // SRC_MAIN_TOOLS_MOUNTS_H_
