/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/root-switch.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/mounts.h"

#include <stdlib.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>


int SwitchRoot(const std::string& new_root) {
  PRINT_DEBUG("Chdir to %s", new_root.c_str());
  if (chdir(new_root.c_str()) < 0) {
    return IsolatorReportSysError(ErrorCode::RootSwitch, "chdir(%s)",
                                  new_root.c_str());
  }

  // move the real root to old_root, then detach it
  char old_root[16] = "old-root-XXXXXX";
  if (mkdtemp(old_root) == NULL) {
    return IsolatorReportSysError(ErrorCode::RootSwitch, "mkdtemp(%s)",
                                  old_root);
  }
  // pivot_root has no wrapper in libc, so we need syscall()
  if (syscall(SYS_pivot_root, ".", old_root) < 0) {
    return IsolatorReportSysError(ErrorCode::RootSwitch,
                                  "pivot_root(., %s)", old_root);
  }
  if (chroot(".") < 0) {
    return IsolatorReportSysError(ErrorCode::RootSwitch, "chroot(.)");
  }
  if (umount2(old_root, MNT_DETACH) < 0) {
    return IsolatorReportSysError(ErrorCode::RootSwitch,
                                  "umount2(%s, MNT_DETACH)", old_root);
  }
  if (rmdir(old_root) < 0) {
    return IsolatorReportSysError(ErrorCode::RootSwitch, "rmdir(%s)",
                                  old_root);
  }
  if (chdir("/") < 0) {
    return IsolatorReportSysError(ErrorCode::RootSwitch, "chdir(/)");
  }
  PRINT_DEBUG("pivoted into %s", new_root.c_str());
  return 0;
}


int MakeUsrReadOnly() {
  struct stat sb;
  if (stat("/usr", &sb) < 0) {
    return IsolatorReportSysError(ErrorCode::RootSwitch, "stat(/usr)");
  }
  if (!S_ISDIR(sb.st_mode)) {
    return IsolatorReportErrorAndMessage("/usr is not a directory",
                                         ErrorCode::RootSwitch);
  }

  // Recursive so binds below /usr (the tools share) survive.
  if (mount("/usr", "/usr", nullptr, MS_BIND | MS_REC, nullptr) < 0) {
    return IsolatorReportSysError(ErrorCode::RootSwitch,
                                  "mount(/usr, /usr, nullptr, MS_BIND | MS_REC)");
  }
  return RemountReadOnly("/usr", ErrorCode::RootSwitch);
}
