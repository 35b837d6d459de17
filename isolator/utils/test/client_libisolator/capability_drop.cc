/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <sys/prctl.h>
#include <assert.h>

#include "src/main/tools/privileges.h"
#include "test-support.h"

static void test_last_capability_matches_kernel() {
    std::string line;
    int last = LastCapability();
    assert(last > 0);
    if (ReadFirstLine("/proc/sys/kernel/cap_last_cap", line) == 0) {
        assert(last == atoi(line.c_str()));
    }
    // One past the last one is not a capability
    assert(prctl(PR_CAPBSET_READ, last + 1, 0, 0, 0) < 0);
}

// Needs CAP_SETPCAP, which a fresh user namespace gives us.
static int drop_in_user_namespace() {
    if (unshare(CLONE_NEWUSER) < 0) {
        printf("unshare(CLONE_NEWUSER): %s, skipping\n", strerror(errno));
        return SKIP_TEST;
    }
    assert(DropBoundingSet() == 0);
    assert(BoundingSetEmpty());
    for (int cap = 0; cap <= LastCapability(); cap++) {
        assert(prctl(PR_CAPBSET_READ, cap, 0, 0, 0) == 0);
    }

    // Dropping again is harmless
    assert(DropBoundingSet() == 0);
    return 0;
}

// Without CAP_SETPCAP every drop fails and the first failure is reported.
static int drop_without_privileges() {
    if (getuid() == 0) {
        return 0;
    }
    assert(DropBoundingSet() < 0);
    assert(IsolatorGetErrorCode() == static_cast<int>(ErrorCode::Privilege));
    return 0;
}

int main() {
    test_last_capability_matches_kernel();

    assert(RunInChild(drop_without_privileges) == 0);

    if (!UserNamespaceSupported()) {
        printf("user namespaces unavailable, skipping\n");
        return SKIP_TEST;
    }
    int res = RunInChild(drop_in_user_namespace);
    if (res == SKIP_TEST)
        return SKIP_TEST;
    assert(res == 0);

    printf("capability drop tests passed\n");
    return 0;
}
