/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_ROOT_SWITCH_H_
#define SRC_MAIN_TOOLS_ROOT_SWITCH_H_

#include <string>

// Makes `new_root` the root of the calling process: pivots into it, then
// detaches and removes the old root so nothing outside stays reachable.
// `new_root` must already be a mount point (see PrepareMountNamespace).
int SwitchRoot(const std::string& new_root);

// Bind-mounts /usr of the current root onto itself and remounts it read-only.
int MakeUsrReadOnly();

#endif  // SRC_MAIN_TOOLS_ROOT_SWITCH_H_
