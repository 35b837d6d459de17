/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <assert.h>

#include "src/main/tools/isolator-api.h"
#include "test-support.h"

int main() {
    printf("starting program out of the sandbox pid=%d\n", getpid());

    const std::string base = MakeTempDir("isolator-declined");
    const std::string dir = base + "/app1";
    SandboxRequest request = MakeSandboxRequest("app1", {"home", "x11"}, dir);

    const int mounts_before = CountMounts();
    int asked = 0;
    ExitOutcome outcome;
    outcome.launched = true;
    int res = CreateEnvironment(request, [&asked]() {
        asked++;
        return false;
    }, &outcome);

    assert(res == 0);
    assert(asked == 1);
    assert(!outcome.launched);
    assert(!outcome.exited);
    assert(outcome.error == ErrorCode::None);

    // The directory is there, nothing else happened
    struct stat sb;
    assert(stat(dir.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode));
    assert(stat((dir + "/usr/bin").c_str(), &sb) == 0 && S_ISDIR(sb.st_mode));
    assert(CountMounts() == mounts_before);
    assert(waitpid(-1, NULL, WNOHANG) < 0 && errno == ECHILD);

    // A second call finds the skeleton and still asks
    res = CreateEnvironment(request, [&asked]() {
        asked++;
        return false;
    }, &outcome);
    assert(res == 0);
    assert(asked == 2);

    // Relative directories are refused before asking
    request.sandbox_dir = "relative/app1";
    res = CreateEnvironment(request, [&asked]() {
        asked++;
        return false;
    }, &outcome);
    assert(res < 0);
    assert(asked == 2);
    assert(outcome.error == ErrorCode::InvalidRequest);

    printf("declined confirmation tests passed\n");
    return 0;
}
