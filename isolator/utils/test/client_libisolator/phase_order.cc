/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <assert.h>

#include "src/main/tools/isolator-api.h"
#include "src/main/tools/privileges.h"
#include "src/main/tools/sandbox-builder.h"
#include "test-support.h"

static void expect_illegal(int res, SandboxBuilder& builder) {
    assert(res < 0);
    assert(IsolatorGetErrorCode() ==
           static_cast<int>(ErrorCode::IllegalTransition));
    assert(builder.phase() == BuildPhase::Init);
}

// None of these may reach the kernel: they would drop our capabilities or
// load a filter into the test process itself.
static void test_steps_refuse_to_skip_ahead() {
    SandboxRequest request = MakeSandboxRequest("app1", {}, "/tmp");
    SandboxBuilder builder(request);
    assert(builder.phase() == BuildPhase::Init);

    expect_illegal(builder.MapIdentity(), builder);
    expect_illegal(builder.ConfigureMounts(), builder);
    expect_illegal(builder.SwitchRoot(), builder);
    expect_illegal(builder.DropCapabilities(), builder);
    expect_illegal(builder.SetNoNewPrivs(), builder);
    expect_illegal(builder.LoadFilter(), builder);
    expect_illegal(builder.Exec(), builder);

    assert(!NoNewPrivsSet());
    assert(strstr(IsolatorGetErrorMsg(), "Exec needs phase FilterLoaded") != NULL);
    // Located by source file and line, then function
    assert(strncmp(IsolatorGetErrorMsg(), "[sandbox-builder.cc:", 20) == 0);
    assert(strstr(IsolatorGetErrorMsg(), " Expect]") != NULL);
}

static void test_builder_environment_starts_from_request() {
    SandboxRequest request = MakeSandboxRequest("app1", {}, "/tmp/sbx///");
    request.environment.clear();
    request.environment["FOO"] = "bar";
    SandboxBuilder builder(request);
    assert(builder.environment().size() == 1);
    assert(builder.environment().at("FOO") == "bar");
    assert(builder.root() == "/tmp/sbx");
}

static void test_phase_names() {
    assert(strcmp(BuildPhaseName(BuildPhase::Init), "Init") == 0);
    assert(strcmp(BuildPhaseName(BuildPhase::FilterLoaded), "FilterLoaded") == 0);
    assert(strcmp(BuildPhaseName(BuildPhase::Execd), "Execd") == 0);
}

static void test_invalid_requests_spawn_nothing() {
    SandboxRequest request = MakeSandboxRequest("app1", {}, "relative/dir");
    ExitOutcome outcome = BuildAndLaunch(request);
    assert(!outcome.launched);
    assert(outcome.error == ErrorCode::InvalidRequest);

    request.sandbox_dir = "/nonexistent/isolator/dir";
    outcome = BuildAndLaunch(request);
    assert(!outcome.launched);
    assert(outcome.error == ErrorCode::InvalidRequest);

    request = MakeSandboxRequest("", {}, "/tmp");
    outcome = BuildAndLaunch(request);
    assert(!outcome.launched);
    assert(outcome.error == ErrorCode::InvalidRequest);

    request = MakeSandboxRequest("app1", {}, "/tmp");
    BindRequest bind;
    bind.source = "usr";
    bind.target = "/usr";
    request.extra_binds.push_back(bind);
    outcome = BuildAndLaunch(request);
    assert(!outcome.launched);
    assert(outcome.error == ErrorCode::InvalidRequest);

    // Still no child of ours
    assert(waitpid(-1, NULL, WNOHANG) < 0 && errno == ECHILD);
}

static void test_only_one_log() {
    const std::string dir = MakeTempDir("isolator-log");
    const std::string log = dir + "/debug.log";
    assert(IsolatorEnableLog(dir + "/missing/debug.log") < 0);
    assert(IsolatorEnableLog(log) == 0);
    assert(IsolatorEnableLog(log) < 0);
    assert(isolator_get_last_error_code() ==
           static_cast<int>(ErrorCode::InvalidRequest));

    struct stat sb;
    assert(stat(log.c_str(), &sb) == 0);
}

int main() {
    printf("starting phase order tests pid=%d\n", getpid());
    test_phase_names();
    test_steps_refuse_to_skip_ahead();
    test_builder_environment_starts_from_request();
    test_invalid_requests_spawn_nothing();
    test_only_one_log();
    printf("phase order tests passed\n");
    return 0;
}
