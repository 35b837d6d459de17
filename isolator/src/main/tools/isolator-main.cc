/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

/**
 * isolator launches one application in a confined environment:
 *
 *  - It runs in new user, PID, network, mount, UTS and IPC namespaces, as
 *    uid 0 mapped to the invoking user.
 *  - Its root is <base-dir>/<app-name>; nothing else of the host is visible
 *    except the requested shares and -M/-m binds.
 *  - /usr is read-only, the capability bounding set is empty, no-new-privs is
 *    set and ptrace, mount and kexec_load fail with EPERM.
 */

#include "src/main/tools/error-handling.h"
#include "src/main/tools/isolator-api.h"
#include "src/main/tools/isolator-options.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <ctype.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <iostream>
#include <string>

#ifndef VERSION
#define VERSION "unknown"
#endif

__attribute__((used, section(".version")))
const char build_version[] = VERSION;


static bool AskConfirmation() {
  std::cout << "Proceed to launch in isolated env? [y/N] " << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer)) {
    return false;
  }
  for (char& ch : answer) {
    ch = static_cast<char>(tolower(static_cast<unsigned char>(ch)));
  }
  return answer == "y" || answer == "yes";
}


static SandboxRequest RequestFromOptions() {
  SandboxRequest request = MakeSandboxRequest(
      opt.app_name, opt.shares, opt.base_dir + "/" + opt.app_name);
  for (size_t i = 0; i < opt.bind_mount_sources.size(); i++) {
    BindRequest bind;
    bind.source = opt.bind_mount_sources[i];
    bind.target = opt.bind_mount_targets[i];
    request.extra_binds.push_back(bind);
  }
  return request;
}


int main(int argc, char *argv[]) {
  ParseOptions(argc, argv);

  // The application owns the terminal while we wait.
  IgnoreSignal(SIGTTIN);
  IgnoreSignal(SIGTTOU);

  const SandboxRequest request = RequestFromOptions();
  PRINT_DEBUG("isolator %s: %s in %s", build_version, request.app_name.c_str(),
              request.sandbox_dir.c_str());

  ExitOutcome outcome;
  std::function<bool()> confirm;
  if (!opt.assume_yes) {
    confirm = AskConfirmation;
  }

  if (CreateEnvironment(request, confirm, &outcome) < 0) {
    fprintf(stderr, "isolator: %s\n", outcome.error_msg.c_str());
    if (outcome.launched) {
      fprintf(stderr, "isolator: construction stopped after phase %s\n",
              BuildPhaseName(outcome.last_phase));
    }
    return EXIT_FAILURE;
  }

  if (!outcome.launched) {
    return EXIT_SUCCESS;
  }
  return outcome.exit_code;
}
