/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <sys/mount.h>
#include <assert.h>

#include "src/main/tools/isolator-options.h"
#include "src/main/tools/mounts.h"
#include "src/main/tools/sandbox-builder.h"
#include "test-support.h"

static SandboxRequest TestRequest() {
    SandboxRequest request;
    request.app_name = "app1";
    request.sandbox_dir = "/tmp/unused";
    request.host_uid = 1234;
    request.host_gid = 1234;
    request.host_home = "/home/alice";
    return request;
}

static void test_parse_share_kind() {
    ShareKind kind;
    assert(ParseShareKind("home", &kind) && kind == ShareKind::Home);
    assert(ParseShareKind("wayland", &kind) && kind == ShareKind::Wayland);
    assert(ParseShareKind("x11", &kind) && kind == ShareKind::X11);
    assert(ParseShareKind("sound", &kind) && kind == ShareKind::Sound);
    assert(ParseShareKind("tools", &kind) && kind == ShareKind::Tools);

    // Tokens are exact
    assert(!ParseShareKind("Home", &kind));
    assert(!ParseShareKind("bogus", &kind));
    assert(!ParseShareKind("", &kind));
    assert(strcmp(ShareKindName(ShareKind::Sound), "sound") == 0);
}

static void test_plan_home() {
    SandboxRequest request = TestRequest();
    EnvironmentMap env;
    MountSpec spec = PlanShare(ShareKind::Home, request, &env);
    assert(spec.source == "/home/alice/Documents");
    assert(spec.target == "/home/user/Documents");
    assert(spec.flags == MS_BIND);
    assert(spec.fstype.empty());
    assert(env.empty());
}

static void test_plan_sockets_follow_uid() {
    SandboxRequest request = TestRequest();
    EnvironmentMap env;
    MountSpec spec = PlanShare(ShareKind::Wayland, request, &env);
    assert(spec.source == "/run/user/1234/wayland-0");
    assert(spec.target == "/run/wayland-0");
    assert(env["XDG_RUNTIME_DIR"] == "/run");
    assert(env["WAYLAND_DISPLAY"] == "wayland-0");

    env.clear();
    spec = PlanShare(ShareKind::Sound, request, &env);
    assert(spec.source == "/run/user/1234/pipewire-0");
    assert(spec.target == "/run/pipewire-0");
    assert(env.size() == 1);
    assert(env["XDG_RUNTIME_DIR"] == "/run");
}

static void test_plan_x11_display() {
    SandboxRequest request = TestRequest();
    EnvironmentMap env;
    MountSpec spec = PlanShare(ShareKind::X11, request, &env);
    assert(spec.source == "/tmp/.X11-unix");
    assert(spec.target == "/tmp/.X11-unix");
    assert(env["DISPLAY"] == ":0");

    request.environment["DISPLAY"] = ":3";
    env.clear();
    PlanShare(ShareKind::X11, request, &env);
    assert(env["DISPLAY"] == ":3");
}

static void test_plan_tools() {
    SandboxRequest request = TestRequest();
    EnvironmentMap env;
    MountSpec spec = PlanShare(ShareKind::Tools, request, &env);
    assert(spec.source == TOOLS_SHARE_BINARY);
    assert(spec.target == TOOLS_SHARE_BINARY);
    assert(env.empty());
}

static void test_unknown_shares_are_skipped() {
    SandboxRequest request = TestRequest();
    request.shares = {"bogus", "HOME"};
    EnvironmentMap env;
    IsolatorClearError();

    // Nothing recognized, so nothing gets mounted
    int res = ApplyShares("/nonexistent-root", request, &env);
    assert(res == 0);
    assert(env.empty());
    assert(IsolatorGetErrorCode() == static_cast<int>(ErrorCode::UnknownShare));
    assert(IsRecoverable(ErrorCode::UnknownShare));
    assert(!IsRecoverable(ErrorCode::Mount));
}

static void test_split_share_list() {
    std::set<std::string> shares;
    SplitShareList("home,x11", &shares);
    SplitShareList(",x11,,bogus,", &shares);
    assert(shares.size() == 3);
    assert(shares.count("home") == 1);
    assert(shares.count("x11") == 1);
    assert(shares.count("bogus") == 1);
}

static void test_resolve_binary() {
    std::string resolved;
    assert(ResolveBinary("sh", "/nonexistent:/bin:/usr/bin", &resolved) == 0);
    assert(resolved == "/bin/sh" || resolved == "/usr/bin/sh");

    assert(ResolveBinary("isolator-no-such-app", "/bin:/usr/bin", &resolved) < 0);
    assert(errno == ENOENT);

    // Directories are not executables
    assert(ResolveBinary("/tmp", "", &resolved) < 0);
}

int main() {
    test_parse_share_kind();
    test_plan_home();
    test_plan_sockets_follow_uid();
    test_plan_x11_display();
    test_plan_tools();
    test_unknown_shares_are_skipped();
    test_split_share_list();
    test_resolve_binary();
    printf("share planning tests passed\n");
    return 0;
}
