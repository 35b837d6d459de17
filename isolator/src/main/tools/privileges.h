/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_PRIVILEGES_H_
#define SRC_MAIN_TOOLS_PRIVILEGES_H_

#include "src/main/tools/error-handling.h"

#include <string>
#include <vector>

// Syscalls answered with EPERM once the filter is loaded.
extern const std::vector<std::string> kDeniedSyscalls;

// Highest capability number of the running kernel, from
// /proc/sys/kernel/cap_last_cap, or by probing the bounding set when that file
// is not readable. -1 if neither works.
int LastCapability();

// Removes every capability the kernel knows from the bounding set. A single
// failure is ErrorCode::Privilege.
int DropBoundingSet();

// True when no capability is left in the bounding set.
bool BoundingSetEmpty();

// Sets PR_SET_NO_NEW_PRIVS.
int BlockPrivilegeEscalation();

bool NoNewPrivsSet();

// Loads a default-allow seccomp filter denying kDeniedSyscalls with EPERM.
// Refuses to load before BlockPrivilegeEscalation(). The filter stays for the
// lifetime of the process and across exec.
int LoadSyscallFilter();

#endif  // SRC_MAIN_TOOLS_PRIVILEGES_H_
