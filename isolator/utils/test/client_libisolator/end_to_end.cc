/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <limits.h>
#include <assert.h>

#include "src/main/tools/isolator-api.h"
#include "test-support.h"

#ifndef ISOLATOR_PROBE_PATH
#error "ISOLATOR_PROBE_PATH must point to the isolator-probe binary"
#endif

#define PROBE_DIR "/opt/isolator"

// There is no root filesystem image here: the host's /usr and top level
// library and binary directories are bound read-only into the sandbox, and
// merged-usr symlinks are recreated as they are.
static void stage_root(const std::string& root, SandboxRequest* request) {
    assert(CreateTarget(root.c_str(), true) == 0);

    BindRequest usr;
    usr.source = "/usr";
    usr.target = "/usr";
    request->extra_binds.push_back(usr);

    const char* top_dirs[] = {"/bin", "/sbin", "/lib", "/lib32", "/lib64", "/libx32", NULL};
    for (int i = 0; top_dirs[i] != NULL; i++) {
        struct stat sb;
        if (lstat(top_dirs[i], &sb) < 0)
            continue;
        if (S_ISLNK(sb.st_mode)) {
            char target[PATH_MAX] = {0};
            assert(readlink(top_dirs[i], target, sizeof(target) - 1) > 0);
            assert(symlink(target, (root + top_dirs[i]).c_str()) == 0);
        } else if (S_ISDIR(sb.st_mode)) {
            BindRequest bind;
            bind.source = top_dirs[i];
            bind.target = top_dirs[i];
            request->extra_binds.push_back(bind);
        }
    }

    BindRequest probe;
    probe.source = ISOLATOR_PROBE_PATH;
    probe.target = PROBE_DIR "/isolator-probe";
    request->extra_binds.push_back(probe);
}

static SandboxRequest probe_request(const std::string& base, const std::string& name,
                                    const std::set<std::string>& shares) {
    const std::string root = base + "/" + name;
    SandboxRequest request = MakeSandboxRequest("isolator-probe", shares, root);
    request.host_home = base + "/home";
    request.environment["PATH"] = PROBE_DIR ":/usr/bin:/bin";
    request.environment["ISOLATOR_PROBE_HOST_MARKER"] = base + "/host-marker";
    stage_root(root, &request);
    return request;
}

static ExitOutcome launch(const SandboxRequest& request) {
    ExitOutcome outcome;
    int res = CreateEnvironment(request, nullptr, &outcome);
    printf("%s: exit code %d, error %d, phase %s: %s\n", request.sandbox_dir.c_str(),
           outcome.exit_code, static_cast<int>(outcome.error),
           BuildPhaseName(outcome.last_phase), outcome.error_msg.c_str());
    if (outcome.error == ErrorCode::None)
        assert(res == 0);
    else
        assert(res < 0);
    return outcome;
}

static void test_home_and_x11(const std::string& base) {
    SandboxRequest request = probe_request(base, "app1", {"home", "x11", "bogus"});
    auto display = request.environment.find("DISPLAY");
    const std::string expected_display =
        (display != request.environment.end() && !display->second.empty())
            ? display->second : ":0";
    request.environment["ISOLATOR_PROBE_MOUNTS"] = "/home/user/Documents:/tmp/.X11-unix";
    request.environment["ISOLATOR_PROBE_ENV"] = "DISPLAY=" + expected_display;

    const int mounts_before = CountMounts();
    ExitOutcome outcome = launch(request);
    assert(outcome.launched);
    assert(outcome.exited);
    assert(outcome.error == ErrorCode::None);
    assert(outcome.last_phase == BuildPhase::Execd);
    assert(outcome.signal == 0);
    assert(outcome.exit_code == 0);

    // Everything happened in the sandbox's own mount namespace
    assert(CountMounts() == mounts_before);
    struct stat sb;
    assert(stat(request.sandbox_dir.c_str(), &sb) == 0);
}

static void test_no_shares(const std::string& base) {
    SandboxRequest request = probe_request(base, "app2", {});
    request.environment["ISOLATOR_PROBE_NO_MOUNTS"] = "/home/user/Documents:/tmp/.X11-unix";

    ExitOutcome outcome = launch(request);
    assert(outcome.launched);
    assert(outcome.error == ErrorCode::None);
    assert(outcome.exit_code == 0);
}

static void test_missing_application(const std::string& base) {
    SandboxRequest request = probe_request(base, "app3", {"home"});
    request.app_name = "isolator-no-such-app";

    ExitOutcome outcome = launch(request);
    assert(outcome.launched);
    assert(outcome.exited);
    assert(outcome.error == ErrorCode::Exec);
    assert(outcome.last_phase == BuildPhase::FilterLoaded);
    assert(outcome.exit_code == EXIT_FAILURE);
    assert(outcome.error_msg.find("isolator-no-such-app") != std::string::npos);
}

static void test_exit_code_is_relayed(const std::string& base) {
    SandboxRequest request = probe_request(base, "app4", {});
    request.environment["ISOLATOR_PROBE_EXIT_CODE"] = "3";

    ExitOutcome outcome = launch(request);
    assert(outcome.launched);
    assert(outcome.exited);
    assert(outcome.error == ErrorCode::None);
    assert(outcome.last_phase == BuildPhase::Execd);
    assert(outcome.signal == 0);
    assert(outcome.exit_code == 3);
}

static void test_failed_mount_is_reported(const std::string& base) {
    SandboxRequest request = probe_request(base, "app5", {});
    BindRequest missing;
    missing.source = base + "/does-not-exist";
    missing.target = "/missing";
    request.extra_binds.push_back(missing);

    ExitOutcome outcome = launch(request);
    assert(outcome.launched);
    assert(outcome.error == ErrorCode::Mount);
    assert(outcome.last_phase == BuildPhase::IdentityMapped);
    assert(outcome.exit_code == EXIT_FAILURE);
}

// The share is bound below /usr before /usr is rebound read-only and must
// still be there afterwards.
static void test_tools_share(const std::string& base) {
    struct stat sb;
    if (stat("/usr/bin/git", &sb) < 0) {
        printf("no /usr/bin/git on this host, skipping the tools share\n");
        return;
    }
    SandboxRequest request = probe_request(base, "app6", {"tools"});
    request.environment["ISOLATOR_PROBE_MOUNTS"] = "/usr/bin/git";
    request.environment["ISOLATOR_PROBE_NO_MOUNTS"] = "/home/user/Documents";

    ExitOutcome outcome = launch(request);
    assert(outcome.launched);
    assert(outcome.error == ErrorCode::None);
    assert(outcome.last_phase == BuildPhase::Execd);
    assert(outcome.exit_code == 0);
}

int main() {
    printf("starting program out of the sandbox pid=%d\n", getpid());
    if (!CanBuildSandboxes()) {
        printf("user namespaces or procfs mounts unavailable, skipping\n");
        return SKIP_TEST;
    }

    const std::string base = MakeTempDir("isolator-e2e");
    assert(CreateTarget((base + "/home/Documents").c_str(), true) == 0);
    assert(CreateTarget((base + "/host-marker").c_str(), false) == 0);

    struct stat sb;
    if (stat("/tmp/.X11-unix", &sb) < 0) {
        assert(mkdir("/tmp/.X11-unix", 01777) == 0);
    }

    assert(IsolatorEnableLog(base + "/isolator.log") == 0);

    test_home_and_x11(base);
    test_no_shares(base);
    test_missing_application(base);
    test_exit_code_is_relayed(base);
    test_failed_mount_is_reported(base);
    test_tools_share(base);

    printf("end to end tests passed\n");
    return 0;
}
