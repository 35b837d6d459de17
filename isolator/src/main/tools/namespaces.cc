/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/namespaces.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <errno.h>
#include <sched.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

const int kSandboxNamespaces = CLONE_NEWUSER | CLONE_NEWPID | CLONE_NEWNET |
                               CLONE_NEWNS | CLONE_NEWUTS | CLONE_NEWIPC;


int EnterNewNamespaces() {
  PRINT_DEBUG("calling unshare(0x%x)...", kSandboxNamespaces);
  if (unshare(kSandboxNamespaces) < 0) {
    return IsolatorReportSysError(ErrorCode::Namespace, "unshare(0x%x)",
                                  kSandboxNamespaces);
  }
  return 0;
}


int MapIdentity(uid_t host_uid, gid_t host_gid) {
  // The kernel refuses an unprivileged gid_map until setgroups is denied, so
  // this has to come first.
  struct stat sb;
  if (stat("/proc/self/setgroups", &sb) == 0) {
    if (WriteFile("/proc/self/setgroups", "deny") < 0) {
      return IsolatorReportSysError(ErrorCode::Namespace,
                                    "write(/proc/self/setgroups)");
    }
  } else {
    // Ignore ENOENT, because older Linux versions do not have this file (but
    // also do not require writing to it).
    if (errno != ENOENT) {
      return IsolatorReportSysError(ErrorCode::Namespace,
                                    "stat(/proc/self/setgroups)");
    }
  }

  PRINT_DEBUG("mapping uid 0 -> %u, gid 0 -> %u", host_uid, host_gid);
  if (WriteFile("/proc/self/uid_map", "0 %u 1\n", host_uid) < 0) {
    return IsolatorReportSysError(ErrorCode::Namespace,
                                  "write(/proc/self/uid_map)");
  }
  if (WriteFile("/proc/self/gid_map", "0 %u 1\n", host_gid) < 0) {
    return IsolatorReportSysError(ErrorCode::Namespace,
                                  "write(/proc/self/gid_map)");
  }
  return 0;
}


int SetupUtsNamespace() {
  if (sethostname(SANDBOX_HOSTNAME, strlen(SANDBOX_HOSTNAME)) < 0) {
    return IsolatorReportSysError(ErrorCode::Namespace, "sethostname");
  }

  if (setdomainname("localdomain", 11) < 0) {
    return IsolatorReportSysError(ErrorCode::Namespace, "setdomainname");
  }
  return 0;
}
