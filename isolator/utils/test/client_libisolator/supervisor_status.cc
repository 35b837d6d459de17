/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <assert.h>
#include <signal.h>

#include "src/main/tools/sandbox-builder.h"
#include "src/main/tools/supervisor.h"
#include "test-support.h"

// Stand-ins for the sandbox child: they write the same records it writes and
// end the way a real child can end.

static void test_killed_after_progress() {
    ExitOutcome outcome = SpawnChildProcess([](int status_fd) {
        SendStatusRecord(status_fd, ErrorCode::None, BuildPhase::Unshared, "");
        SendStatusRecord(status_fd, ErrorCode::None, BuildPhase::MountsConfigured, "");
        raise(SIGKILL);
    });
    assert(outcome.launched);
    assert(outcome.exited);
    assert(outcome.error == ErrorCode::None);
    assert(outcome.last_phase == BuildPhase::MountsConfigured);
    assert(outcome.signal == SIGKILL);
    assert(outcome.exit_code == 128 + SIGKILL);
}

static void test_exit_without_records() {
    ExitOutcome outcome = SpawnChildProcess([](int) { _exit(0); });
    assert(outcome.launched);
    assert(outcome.exited);
    assert(outcome.error == ErrorCode::None);
    assert(outcome.last_phase == BuildPhase::Init);
    assert(outcome.exit_code == 0);
}

static void test_exec_after_filter() {
    ExitOutcome outcome = SpawnChildProcess([](int status_fd) {
        SendStatusRecord(status_fd, ErrorCode::None, BuildPhase::FilterLoaded, "");
        execl("/bin/sh", "sh", "-c", "exit 4", (char*)NULL);
        _exit(EXIT_FAILURE);
    });
    assert(outcome.error == ErrorCode::None);
    assert(outcome.last_phase == BuildPhase::Execd);
    assert(outcome.exit_code == 4);
}

static void test_first_error_wins() {
    ExitOutcome outcome = SpawnChildProcess([](int status_fd) {
        SendStatusRecord(status_fd, ErrorCode::None, BuildPhase::IdentityMapped, "");
        SendStatusRecord(status_fd, ErrorCode::Mount, BuildPhase::IdentityMapped,
                         "mount(/usr) failed");
        SendStatusRecord(status_fd, ErrorCode::GeneralOSError,
                         BuildPhase::IdentityMapped, "waitpid failed");
        _exit(EXIT_FAILURE);
    });
    assert(outcome.exited);
    assert(outcome.error == ErrorCode::Mount);
    assert(outcome.last_phase == BuildPhase::IdentityMapped);
    assert(outcome.error_msg == "mount(/usr) failed");
    assert(outcome.exit_code == EXIT_FAILURE);
    assert(IsolatorGetErrorCode() == static_cast<int>(ErrorCode::Mount));
}

// A grandchild holding the pipe open delays EOF, and its records still count.
static void test_records_from_grandchild() {
    ExitOutcome outcome = SpawnChildProcess([](int status_fd) {
        SendStatusRecord(status_fd, ErrorCode::None, BuildPhase::IdentityMapped, "");
        pid_t pid = fork();
        if (pid == 0) {
            SendStatusRecord(status_fd, ErrorCode::None, BuildPhase::RootSwitched, "");
            _exit(0);
        }
        int status;
        if (pid < 0 || WaitForProcess(pid, &status) < 0)
            _exit(EXIT_FAILURE);
        close(status_fd);
        ExitLikeChild(status);
    });
    assert(outcome.error == ErrorCode::None);
    assert(outcome.last_phase == BuildPhase::RootSwitched);
    assert(outcome.exit_code == 0);
}

int main() {
    printf("starting status pipe tests pid=%d\n", getpid());
    test_exit_without_records();
    test_killed_after_progress();
    test_exec_after_filter();
    test_first_error_wins();
    test_records_from_grandchild();
    printf("status pipe tests passed\n");
    return 0;
}
