/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/privileges.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <errno.h>
#include <seccomp.h>
#include <stdlib.h>
#include <sys/prctl.h>

#include <memory>

// Upper limit when probing; well above anything the kernel defines.
#define MAX_PROBED_CAP 255

const std::vector<std::string> kDeniedSyscalls = {"ptrace", "mount",
                                                  "kexec_load"};


int LastCapability() {
  std::string line;
  if (ReadFirstLine("/proc/sys/kernel/cap_last_cap", line) == 0) {
    char *end = nullptr;
    errno = 0;
    long value = strtol(line.c_str(), &end, 10);
    if (errno == 0 && end != line.c_str() && value >= 0) {
      return static_cast<int>(value);
    }
  }

  // The bounding set answers EINVAL past the last valid capability.
  int last = -1;
  for (int cap = 0; cap <= MAX_PROBED_CAP; cap++) {
    if (prctl(PR_CAPBSET_READ, cap, 0, 0, 0) < 0) {
      break;
    }
    last = cap;
  }
  return last;
}


int DropBoundingSet() {
  const int last_cap = LastCapability();
  if (last_cap < 0) {
    return IsolatorReportErrorAndMessage(
        "Cannot determine the capabilities of the running kernel",
        ErrorCode::Privilege);
  }

  PRINT_DEBUG("dropping capabilities 0..%d from the bounding set", last_cap);
  for (int cap = 0; cap <= last_cap; cap++) {
    if (prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) < 0) {
      return IsolatorReportSysError(ErrorCode::Privilege,
                                    "prctl(PR_CAPBSET_DROP, %d)", cap);
    }
  }
  return 0;
}


bool BoundingSetEmpty() {
  const int last_cap = LastCapability();
  if (last_cap < 0) {
    return false;
  }
  for (int cap = 0; cap <= last_cap; cap++) {
    if (prctl(PR_CAPBSET_READ, cap, 0, 0, 0) != 0) {
      return false;
    }
  }
  return true;
}


int BlockPrivilegeEscalation() {
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
    return IsolatorReportSysError(ErrorCode::Privilege,
                                  "prctl(PR_SET_NO_NEW_PRIVS)");
  }
  return 0;
}


bool NoNewPrivsSet() {
  return prctl(PR_GET_NO_NEW_PRIVS, 0, 0, 0, 0) == 1;
}


int LoadSyscallFilter() {
  if (!NoNewPrivsSet()) {
    return IsolatorReportErrorAndMessage(
        "no_new_privs must be set before the filter is loaded",
        ErrorCode::Filter);
  }

  std::unique_ptr<void, void (*)(scmp_filter_ctx)> ctx(
      seccomp_init(SCMP_ACT_ALLOW), seccomp_release);
  if (!ctx) {
    return IsolatorReportErrorAndMessage("seccomp_init failed",
                                         ErrorCode::Filter);
  }

  // no_new_privs is ours to set, see above.
  int rc = seccomp_attr_set(ctx.get(), SCMP_FLTATR_CTL_NNP, 0);
  if (rc < 0) {
    errno = -rc;
    return IsolatorReportSysError(ErrorCode::Filter,
                                  "seccomp_attr_set(SCMP_FLTATR_CTL_NNP)");
  }

  for (const std::string& name : kDeniedSyscalls) {
    const int nr = seccomp_syscall_resolve_name(name.c_str());
    if (nr == __NR_SCMP_ERROR) {
      return IsolatorReportErrorAndMessage("unknown syscall " + name,
                                           ErrorCode::Filter);
    }
    rc = seccomp_rule_add(ctx.get(), SCMP_ACT_ERRNO(EPERM), nr, 0);
    if (rc < 0) {
      errno = -rc;
      return IsolatorReportSysError(ErrorCode::Filter,
                                    "seccomp_rule_add(%s)", name.c_str());
    }
  }

  rc = seccomp_load(ctx.get());
  if (rc < 0) {
    errno = -rc;
    return IsolatorReportSysError(ErrorCode::Filter, "seccomp_load");
  }
  PRINT_DEBUG("syscall filter loaded");
  return 0;
}
