// Copyright 2017 The Bazel Authors. All rights reserved.
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

#include "src/main/tools/logging.h"
#include "src/main/tools/privileges.h"
#include "src/main/tools/process-tools.h"

#include <sys/utsname.h>
#include <gnu/libc-version.h>
#include <string>
#include <stdexcept>


FILE *global_debug = nullptr;


static void logOSKernel() {
  struct utsname buf;
  bool res = GetKernelInfo(&buf);
  if (res) {
    PRINT_DEBUG("OS: %s", buf.sysname);
    PRINT_DEBUG("Kernel: %s", buf.release);
    PRINT_DEBUG("Version: %s", buf.version);
    PRINT_DEBUG("Machine: %s", buf.machine);
  } else {
    PRINT_DEBUG("uname failed: %s", strerror(errno));
  }
}


static void logLibc() {
  PRINT_DEBUG("libc: %s", gnu_get_libc_version());
}


static void logLibstdcpp() {
#ifdef _GLIBCXX_RELEASE
  PRINT_DEBUG("libstdc++ release: %d", _GLIBCXX_RELEASE);
#endif

#ifdef __GLIBCXX__
  PRINT_DEBUG("__GLIBCXX__: %d", __GLIBCXX__);
#endif
}


static void logOSName() {
  try {
    std::string pretty, version;
    const bool ok = GetOSName(pretty, version);

    if (!ok) {
      PRINT_DEBUG("Can't log OS info: /etc/os-release missing or keys not found");
      return;
    }

    if (!pretty.empty()) {
      PRINT_DEBUG("OS NAME: %s", pretty.c_str());
    } else {
      PRINT_DEBUG("OS NAME not found");
    }

    if (!version.empty()) {
      PRINT_DEBUG("OS VERSION_ID: %s", version.c_str());
    } else {
      PRINT_DEBUG("OS VERSION_ID not found");
    }
  } catch (const std::exception& e) {
    PRINT_DEBUG("Can't log OS info (exception): %s", e.what());
  }
}


static void logCapabilities() {
  int last_cap = LastCapability();
  if (last_cap < 0) {
    PRINT_DEBUG("Can't read the last capability of the running kernel");
    return;
  }
  PRINT_DEBUG("cap_last_cap: %d", last_cap);
  PRINT_DEBUG("user namespaces: %s",
              UserNamespaceSupported() ? "supported" : "not supported");
}


void logSystem() {
  if (global_debug == nullptr)
    return;
  logOSKernel();
  logOSName();
  logLibc();
  logLibstdcpp();
  logCapabilities();
}
