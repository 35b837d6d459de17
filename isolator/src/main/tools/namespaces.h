/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_NAMESPACES_H_
#define SRC_MAIN_TOOLS_NAMESPACES_H_

#include <sys/types.h>

// Namespaces every sandbox gets, requested in a single unshare(2).
extern const int kSandboxNamespaces;

#define SANDBOX_HOSTNAME "isolator"

// Moves the calling process into new user, pid, network, mount, UTS and IPC
// namespaces. All of them or none: a failure is ErrorCode::Namespace.
int EnterNewNamespaces();

// Maps uid/gid 0 of the new user namespace to the invoking user and denies
// setgroups(2). Must run right after EnterNewNamespaces(), before any mount.
int MapIdentity(uid_t host_uid, gid_t host_gid);

// Gives the new UTS namespace its own host and domain name.
int SetupUtsNamespace();

#endif  // SRC_MAIN_TOOLS_NAMESPACES_H_
