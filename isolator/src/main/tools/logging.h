// Copyright 2015 The Bazel Authors. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SRC_MAIN_TOOLS_LOGGING_H_
#define SRC_MAIN_TOOLS_LOGGING_H_

#include <errno.h>
#include <inttypes.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

// see
// http://stackoverflow.com/questions/5641427/how-to-make-preprocessor-generate-a-string-for-line-keyword
#define S(x) #x
#define S_(x) S(x)
#define S__LINE__ S_(__LINE__)

// Prints the message and the description of the current errno to stderr and
// terminates the process. Only meant for the command line front end; the
// library reports errors through error-handling.h instead.
#define DIE(...)                                                \
  {                                                             \
    fprintf(stderr, __FILE__ ":" S__LINE__ ": \"" __VA_ARGS__); \
    fprintf(stderr, "\": ");                                    \
    perror(nullptr);                                            \
    exit(EXIT_FAILURE);                                         \
  }

#define PRINT_DEBUG(fmt, ...)                                         \
  do {                                                                \
    if (global_debug) {                                               \
      struct timespec ts;                                             \
      clock_gettime(CLOCK_REALTIME, &ts);                             \
                                                                      \
      fprintf(global_debug, "%" PRId64 ".%09ld: %s:%d: " fmt "\n",    \
              ((int64_t)ts.tv_sec), ts.tv_nsec, __FILE__, __LINE__,   \
              ##__VA_ARGS__);                                         \
      fflush(global_debug);                                           \
    }                                                                 \
  } while (false)

#define PRINT_WARNING(fmt, ...)                                       \
  do {                                                                \
    fprintf(stderr, "Warning: " fmt "\n", ##__VA_ARGS__);             \
    PRINT_DEBUG("Warning: " fmt, ##__VA_ARGS__);                      \
  } while (false)

// Debug output goes here when non-null (-D).
extern FILE *global_debug;

// Writes the host details that matter for sandbox construction (kernel,
// distribution, libc and the capability range) to the debug log.
void logSystem();

#endif  // SRC_MAIN_TOOLS_LOGGING_H_
