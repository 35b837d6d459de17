/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>
#include "src/main/tools/isolator-api.h"


namespace py = pybind11;
PYBIND11_MODULE(pyisolator, m) {
    m.doc() = "Python bindings for libisolator";

    py::enum_<ErrorCode>(m, "ErrorCode")
        .value("NONE", ErrorCode::None)
        .value("NAMESPACE", ErrorCode::Namespace)
        .value("MOUNT", ErrorCode::Mount)
        .value("ROOT_SWITCH", ErrorCode::RootSwitch)
        .value("PRIVILEGE", ErrorCode::Privilege)
        .value("FILTER", ErrorCode::Filter)
        .value("EXEC", ErrorCode::Exec)
        .value("FORK", ErrorCode::Fork)
        .value("INVALID_REQUEST", ErrorCode::InvalidRequest)
        .value("ILLEGAL_TRANSITION", ErrorCode::IllegalTransition)
        .value("GENERAL_OS_ERROR", ErrorCode::GeneralOSError)
        .value("UNKNOWN_SHARE", ErrorCode::UnknownShare)
        .value("UNKNOWN", ErrorCode::Unknown);

    py::enum_<BuildPhase>(m, "BuildPhase")
        .value("INIT", BuildPhase::Init)
        .value("UNSHARED", BuildPhase::Unshared)
        .value("IDENTITY_MAPPED", BuildPhase::IdentityMapped)
        .value("MOUNTS_CONFIGURED", BuildPhase::MountsConfigured)
        .value("ROOT_SWITCHED", BuildPhase::RootSwitched)
        .value("CAPABILITIES_DROPPED", BuildPhase::CapabilitiesDropped)
        .value("NO_NEW_PRIVS_SET", BuildPhase::NoNewPrivsSet)
        .value("FILTER_LOADED", BuildPhase::FilterLoaded)
        .value("EXECD", BuildPhase::Execd);

    py::class_<BindRequest>(m, "BindRequest")
        .def(py::init<>())
        .def_readwrite("source", &BindRequest::source)
        .def_readwrite("target", &BindRequest::target)
        .def_readwrite("writable", &BindRequest::writable);

    py::class_<SandboxRequest>(m, "SandboxRequest")
        .def(py::init(&MakeSandboxRequest), py::arg("app_name"),
             py::arg("shares"), py::arg("sandbox_dir"),
             "Request for the calling user with its current environment")
        .def_readwrite("app_name", &SandboxRequest::app_name)
        .def_readwrite("shares", &SandboxRequest::shares)
        .def_readwrite("sandbox_dir", &SandboxRequest::sandbox_dir)
        .def_readwrite("host_uid", &SandboxRequest::host_uid)
        .def_readwrite("host_gid", &SandboxRequest::host_gid)
        .def_readwrite("host_home", &SandboxRequest::host_home)
        .def_readwrite("environment", &SandboxRequest::environment)
        .def_readwrite("extra_binds", &SandboxRequest::extra_binds);

    py::class_<ExitOutcome>(m, "ExitOutcome")
        .def_readonly("launched", &ExitOutcome::launched)
        .def_readonly("exited", &ExitOutcome::exited)
        .def_readonly("exit_code", &ExitOutcome::exit_code)
        .def_readonly("signal", &ExitOutcome::signal)
        .def_readonly("error", &ExitOutcome::error)
        .def_readonly("last_phase", &ExitOutcome::last_phase)
        .def_readonly("error_msg", &ExitOutcome::error_msg);

    m.def("build_and_launch", &isolator_build_and_launch, py::arg("request"),
          "Build the sandbox in a child process and wait for the application");
    m.def("create_environment",
          [](const SandboxRequest& request, std::function<bool()> confirm) {
            ExitOutcome outcome;
            isolator_create_environment(request, confirm, &outcome);
            return outcome;
          },
          py::arg("request"), py::arg("confirm") = nullptr,
          "Create the sandbox directory, ask confirm() and launch");
    m.def("enable_log", &isolator_enable_log, py::arg("path"), "Set a path where to store the log");

    m.def("get_last_error_code", &isolator_get_last_error_code);
    m.def("get_last_error_msg", []() -> std::string { return std::string(isolator_get_last_error_msg()); });
}
