// Copyright 2016 The Bazel Authors. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "src/main/tools/mounts.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <errno.h>
#include <string.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

#ifndef MS_REC
// Some systems do not define MS_REC in sys/mount.h. We might be able to grab it
// from linux/fs.h instead (cf. #2667).
#include <linux/fs.h>
#endif

struct ShareName {
  const char *token;
  ShareKind kind;
};

static const ShareName kShareNames[] = {
    {"home", ShareKind::Home},   {"wayland", ShareKind::Wayland},
    {"x11", ShareKind::X11},     {"sound", ShareKind::Sound},
    {"tools", ShareKind::Tools},
};


bool ParseShareKind(const std::string& token, ShareKind* kind) {
  for (const ShareName& name : kShareNames) {
    if (token == name.token) {
      *kind = name.kind;
      return true;
    }
  }
  return false;
}


const char* ShareKindName(ShareKind kind) {
  for (const ShareName& name : kShareNames) {
    if (name.kind == kind) {
      return name.token;
    }
  }
  return "unknown";
}


static std::string RuntimeDir(uid_t uid) {
  return "/run/user/" + std::to_string(uid);
}


MountSpec PlanShare(ShareKind kind, const SandboxRequest& request,
                    EnvironmentMap* env) {
  MountSpec spec;
  spec.flags = MS_BIND;

  switch (kind) {
    case ShareKind::Home:
      // Only Documents, never the whole home directory.
      spec.source = request.host_home + "/Documents";
      spec.target = "/home/user/Documents";
      break;
    case ShareKind::Wayland:
      spec.source = RuntimeDir(request.host_uid) + "/wayland-0";
      spec.target = "/run/wayland-0";
      (*env)["XDG_RUNTIME_DIR"] = "/run";
      (*env)["WAYLAND_DISPLAY"] = "wayland-0";
      break;
    case ShareKind::X11: {
      spec.source = "/tmp/.X11-unix";
      spec.target = "/tmp/.X11-unix";
      auto display = request.environment.find("DISPLAY");
      if (display != request.environment.end() && !display->second.empty()) {
        (*env)["DISPLAY"] = display->second;
      } else {
        (*env)["DISPLAY"] = ":0";
      }
      break;
    }
    case ShareKind::Sound:
      spec.source = RuntimeDir(request.host_uid) + "/pipewire-0";
      spec.target = "/run/pipewire-0";
      (*env)["XDG_RUNTIME_DIR"] = "/run";
      break;
    case ShareKind::Tools:
      spec.source = TOOLS_SHARE_BINARY;
      spec.target = TOOLS_SHARE_BINARY;
      break;
  }
  return spec;
}


// Bind mounts spec.source on new_root + spec.target, creating the target with
// the same type as the source first.
static int BindIntoRoot(const std::string& new_root, const MountSpec& spec) {
  struct stat sb;
  if (stat(spec.source.c_str(), &sb) < 0) {
    return IsolatorReportSysError(ErrorCode::Mount, "stat(%s)",
                                  spec.source.c_str());
  }

  const std::string full_target = new_root + spec.target;
  if (CreateTarget(full_target.c_str(), S_ISDIR(sb.st_mode)) < 0) {
    return IsolatorReportSysError(ErrorCode::Mount, "CreateTarget(%s)",
                                  full_target.c_str());
  }

  PRINT_DEBUG("mount(%s, %s, nullptr, 0x%lx, nullptr)", spec.source.c_str(),
              full_target.c_str(), spec.flags);
  if (mount(spec.source.c_str(), full_target.c_str(), nullptr, spec.flags,
            nullptr) < 0) {
    return IsolatorReportSysError(ErrorCode::Mount,
                                  "mount(%s, %s, nullptr, 0x%lx, nullptr)",
                                  spec.source.c_str(), full_target.c_str(),
                                  spec.flags);
  }
  return 0;
}


int RemountReadOnly(const std::string& path, ErrorCode code) {
  struct statvfs vfs;
  unsigned long mountFlags = MS_BIND | MS_REMOUNT | MS_RDONLY;

  if (statvfs(path.c_str(), &vfs) < 0) {
    return IsolatorReportSysError(code, "statvfs(%s)", path.c_str());
  }

  // Flags locked by the outer namespace must be repeated or the remount fails
  // with EPERM.
  if (vfs.f_flag & ST_NOSUID) {
    mountFlags |= MS_NOSUID;
  }
  if (vfs.f_flag & ST_NODEV) {
    mountFlags |= MS_NODEV;
  }
  if (vfs.f_flag & ST_NOEXEC) {
    mountFlags |= MS_NOEXEC;
  }
  if (vfs.f_flag & ST_NOATIME) {
    mountFlags |= MS_NOATIME;
  }
  if (vfs.f_flag & ST_NODIRATIME) {
    mountFlags |= MS_NODIRATIME;
  }
  if (vfs.f_flag & ST_RELATIME) {
    mountFlags |= MS_RELATIME;
  }

  PRINT_DEBUG("Remounting RO %s", path.c_str());
  if (mount(nullptr, path.c_str(), nullptr, mountFlags, nullptr) < 0) {
    return IsolatorReportSysError(code, "remount(%s, 0x%lx)", path.c_str(),
                                  mountFlags);
  }
  return 0;
}


static int MountProc(const std::string& new_root) {
  const std::string proc = new_root + "/proc";
  if (CreateTarget(proc.c_str(), true) < 0) {
    return IsolatorReportSysError(ErrorCode::Mount, "CreateTarget(%s)",
                                  proc.c_str());
  }
  // A fresh instance, the inherited one still describes the parent PID
  // namespace.
  if (mount("proc", proc.c_str(), "proc", MS_NODEV | MS_NOEXEC | MS_NOSUID,
            nullptr) < 0) {
    return IsolatorReportSysError(ErrorCode::Mount, "mount(proc, %s)",
                                  proc.c_str());
  }
  return 0;
}


static int MountDev(const std::string& new_root) {
  const char *devs[] = {"/dev/null", "/dev/random", "/dev/urandom",
                        "/dev/zero", NULL};
  for (int i = 0; devs[i] != NULL; i++) {
    MountSpec spec;
    spec.source = devs[i];
    spec.target = devs[i];
    spec.flags = MS_BIND;
    if (BindIntoRoot(new_root, spec) < 0) {
      return UNRECOVERABLE_FAIL;
    }
  }

  const std::string fd_link = new_root + "/dev/fd";
  if (symlink("/proc/self/fd", fd_link.c_str()) < 0 && errno != EEXIST) {
    return IsolatorReportSysError(ErrorCode::Mount, "symlink(%s)",
                                  fd_link.c_str());
  }
  return 0;
}


static int MountTmp(const std::string& new_root) {
  const std::string tmp = new_root + "/tmp";
  if (CreateTarget(tmp.c_str(), true) < 0) {
    return IsolatorReportSysError(ErrorCode::Mount, "CreateTarget(%s)",
                                  tmp.c_str());
  }
  if (mount("tmpfs", tmp.c_str(), "tmpfs", MS_NOSUID | MS_NODEV | MS_NOATIME,
            "mode=1777") < 0) {
    return IsolatorReportSysError(ErrorCode::Mount, "mount(tmpfs, %s)",
                                  tmp.c_str());
  }
  return 0;
}


int PrepareMountNamespace(const std::string& new_root) {
  // Nothing mounted from now on may propagate back to the host.
  if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) < 0) {
    return IsolatorReportSysError(ErrorCode::Mount,
                                  "mount(/, MS_REC | MS_PRIVATE)");
  }

  // pivot_root(2) needs the new root to be a mount point.
  if (mount(new_root.c_str(), new_root.c_str(), nullptr, MS_BIND | MS_REC,
            nullptr) < 0) {
    return IsolatorReportSysError(ErrorCode::Mount,
                                  "mount(%s, %s, nullptr, MS_BIND | MS_REC)",
                                  new_root.c_str(), new_root.c_str());
  }
  PRINT_DEBUG("mounted %s", new_root.c_str());

  if (MountProc(new_root) < 0)
    return UNRECOVERABLE_FAIL;
  if (MountDev(new_root) < 0)
    return UNRECOVERABLE_FAIL;
  if (MountTmp(new_root) < 0)
    return UNRECOVERABLE_FAIL;
  return 0;
}


int ApplyExtraBinds(const std::string& new_root,
                    const std::vector<BindRequest>& binds) {
  for (const BindRequest& bind : binds) {
    MountSpec spec;
    spec.source = bind.source;
    spec.target = bind.target;
    spec.flags = MS_BIND | MS_REC;
    if (BindIntoRoot(new_root, spec) < 0) {
      return UNRECOVERABLE_FAIL;
    }
    if (!bind.writable &&
        RemountReadOnly(new_root + bind.target, ErrorCode::Mount) < 0) {
      return UNRECOVERABLE_FAIL;
    }
  }
  return 0;
}


int ApplyShares(const std::string& new_root, const SandboxRequest& request,
                EnvironmentMap* env) {
  for (const std::string& token : request.shares) {
    ShareKind kind;
    if (!ParseShareKind(token, &kind)) {
      // The application simply does not get this resource.
      PRINT_WARNING("Unknown share: %s", token.c_str());
      IsolatorReportErrorAndMessage(token, ErrorCode::UnknownShare);
      continue;
    }

    EnvironmentMap share_env;
    const MountSpec spec = PlanShare(kind, request, &share_env);
    PRINT_DEBUG("share %s: %s -> %s", ShareKindName(kind),
                spec.source.c_str(), spec.target.c_str());
    if (BindIntoRoot(new_root, spec) < 0) {
      return UNRECOVERABLE_FAIL;
    }
    for (const auto& var : share_env) {
      (*env)[var.first] = var.second;
    }
  }
  return 0;
}
