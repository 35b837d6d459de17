/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */


#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"

#include <vector>


static IsolatorError sbx_err;


static void GenErrorMessage(const std::string& err_msg, const char* file,
                            int line, const char* func, std::string& out) {
  const char* base = strrchr(file, '/');
  base = (base != nullptr) ? base + 1 : file;
  out = "[" + std::string(base) + ":" + std::to_string(line) + " " +
        std::string(func) + "]" + err_msg;
}


static void IsolatorSetError(const std::string& err_msg, ErrorCode code, int& ret) {
  memset(sbx_err.msg, 0, MAX_ERR_LEN);
  strncpy(sbx_err.msg, err_msg.c_str(), MAX_ERR_LEN - 1);
  sbx_err.msg[MAX_ERR_LEN - 1] = '\0';
  sbx_err.code = code;

  PRINT_DEBUG("error %d: %s", static_cast<int>(code), sbx_err.msg);

  if (IsRecoverable(code))
    ret = RECOVERABLE_FAIL;
  else
    ret = UNRECOVERABLE_FAIL;
}


int IsolatorReportGenericError_impl(const std::string& err_msg, const char* file, int line, const char* func) {
  return IsolatorReportErrorAndMessage_impl(err_msg, ErrorCode::GeneralOSError, file, line, func);
}


int IsolatorReportErrorAndMessage_impl(std::string err_msg, ErrorCode code, const char* file, int line, const char* func) {
  std::string msg;
  std::string code_msg;
  int ret = 0;

  code_msg = GetErrorMessage(code);
  if (!err_msg.empty())
    code_msg += ": " + err_msg;

  GenErrorMessage(code_msg, file, line, func, msg);
  IsolatorSetError(msg, code, ret);
  return ret;
}


int IsolatorReportSysError_impl(ErrorCode code, const char* file, int line, const char* func,
                                const char* fmt, ...) {
  // Formatting may clobber errno.
  const int saved_errno = errno;

  va_list args;
  va_start(args, fmt);
  int size = std::vsnprintf(nullptr, 0, fmt, args) + 1;
  va_end(args);

  std::vector<char> buffer(size > 0 ? size : 1);
  va_start(args, fmt);
  std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
  va_end(args);

  std::string err_msg(buffer.data());
  err_msg += ": ";
  err_msg += strerror(saved_errno);

  int ret = IsolatorReportErrorAndMessage_impl(err_msg, code, file, line, func);
  errno = saved_errno;
  return ret;
}


void IsolatorSetLastError(const IsolatorError& err) {
  sbx_err = err;
  sbx_err.msg[MAX_ERR_LEN - 1] = '\0';
}


void IsolatorClearError() {
  memset(sbx_err.msg, 0, MAX_ERR_LEN);
  sbx_err.code = ErrorCode::None;
}


IsolatorError IsolatorGetLastError() {
  return sbx_err;
}


const char* IsolatorGetErrorMsg() {
  return sbx_err.msg;
}


int IsolatorGetErrorCode() {
  return static_cast<int>(sbx_err.code);
}
