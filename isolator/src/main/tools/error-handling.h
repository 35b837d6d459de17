/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef _ERROR_HANDLING_H
#define _ERROR_HANDLING_H

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <string>

#define MAX_ERR_LEN 255

#define UNRECOVERABLE_FAIL -1
#define RECOVERABLE_FAIL -2
#define RECOVERABLE_ERROR_CODES -200


enum class ErrorCode : int {
  None = 0,
  Namespace = -1,
  Mount = -2,
  RootSwitch = -3,
  Privilege = -4,
  Filter = -5,
  Exec = -6,
  Fork = -7,
  InvalidRequest = -8,
  IllegalTransition = -9,
  GeneralOSError = -100,
  // Error codes from -201 are recoverables
  UnknownShare = -201,
  Unknown = -1000
};

inline std::string GetErrorMessage(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:
      return ": No error";
    case ErrorCode::Namespace:
      return " : Could not enter the new namespaces or map the user identity";
    case ErrorCode::Mount:
      return " : Could not set up the sandbox mounts";
    case ErrorCode::RootSwitch:
      return " : Could not switch to the sandbox root";
    case ErrorCode::Privilege:
      return " : Could not drop privileges";
    case ErrorCode::Filter:
      return " : Could not load the syscall filter";
    case ErrorCode::Exec:
      return " : Could not execute the application";
    case ErrorCode::Fork:
      return " : Could not create the sandbox process";
    case ErrorCode::InvalidRequest:
      return " : Invalid sandbox request";
    case ErrorCode::IllegalTransition:
      return " : Sandbox construction steps called out of order";
    case ErrorCode::GeneralOSError:
      return " : OS Error";
    case ErrorCode::UnknownShare:
      return " : Unknown share, skipped";
    case ErrorCode::Unknown:
    default:
      return ": Unknown error occurred";
  }
}

inline bool IsRecoverable(ErrorCode code) {
  return static_cast<int>(code) < RECOVERABLE_ERROR_CODES &&
         code != ErrorCode::Unknown;
}

typedef struct {
  char msg[MAX_ERR_LEN];
  ErrorCode code;
} IsolatorError;

#define IsolatorReportGenericError(msg) \
    IsolatorReportGenericError_impl((msg), __FILE__, __LINE__, __func__)

int IsolatorReportGenericError_impl(const std::string& err_msg, const char* file, int line, const char* func);

#define IsolatorReportErrorAndMessage(msg, code) \
    IsolatorReportErrorAndMessage_impl((msg), (code), __FILE__, __LINE__, __func__)

int IsolatorReportErrorAndMessage_impl(std::string err_msg, ErrorCode code, const char* file, int line, const char* func);

// Same as IsolatorReportErrorAndMessage but formats the message and appends
// the description of the current errno, for failed system calls.
#define IsolatorReportSysError(code, ...) \
    IsolatorReportSysError_impl((code), __FILE__, __LINE__, __func__, __VA_ARGS__)

int IsolatorReportSysError_impl(ErrorCode code, const char* file, int line, const char* func,
                                const char* fmt, ...) __attribute__((format(printf, 5, 6)));

// Overwrites the last error, e.g. with a record received from a child process.
void IsolatorSetLastError(const IsolatorError& err);
void IsolatorClearError();

IsolatorError IsolatorGetLastError();
const char* IsolatorGetErrorMsg();
int IsolatorGetErrorCode();

#endif
