/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

// Entry points for programs embedding the sandbox and for the Python
// bindings. They only take std types and the request/outcome structs.

#ifndef SRC_MAIN_TOOLS_ISOLATOR_API_H_
#define SRC_MAIN_TOOLS_ISOLATOR_API_H_

#include "src/main/tools/sandbox-request.h"
#include "src/main/tools/supervisor.h"

#include <functional>
#include <string>

// Creates the sandbox directory of `request` with an empty usr/bin skeleton,
// then asks `confirm` (when set) before launching. A declined confirmation
// returns 0 with `outcome->launched` false and spawns nothing. Otherwise the
// outcome of BuildAndLaunch is stored in `outcome` and a negative value is
// returned if the construction failed.
int CreateEnvironment(const SandboxRequest& request,
                      const std::function<bool()>& confirm,
                      ExitOutcome* outcome);

// Sends debug output to `path`. The parent directory must exist and only one
// log file can be enabled per process.
int IsolatorEnableLog(const std::string& path);

int isolator_create_environment(const SandboxRequest& request,
                                const std::function<bool()>& confirm,
                                ExitOutcome* outcome);
ExitOutcome isolator_build_and_launch(const SandboxRequest& request);
int isolator_enable_log(const std::string& path);

// Returns error code and error messages
int isolator_get_last_error_code();
const char* isolator_get_last_error_msg();

#endif  // SRC_MAIN_TOOLS_ISOLATOR_API_H_
