// Copyright 2016 The Bazel Authors. All rights reserved.
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

#include "src/main/tools/isolator-options.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/isolator-api.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <errno.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <fstream>
#include <memory>
#include <string>
#include <vector>

using std::ifstream;
using std::unique_ptr;
using std::vector;

struct Options opt;


// Print out a usage error. argc and argv are the argument counter and vector,
// fmt is a format, string for the error message to print.
static void Usage(char *program_name, const char *fmt, ...)
    __attribute__((format(printf, 2, 3)));

static void Usage(char *program_name, const char *fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vfprintf(stderr, fmt, ap);
  va_end(ap);

  fprintf(stderr, "\nUsage: %s [options] -- app-name @args\n", program_name);
  fprintf(
      stderr,
      "\nPossible arguments:\n"
      "  -s <share>[,<share>...]  host resources to share with the "
      "application: home, wayland, x11, sound, tools. Can be repeated\n"
      "  -b <base-dir>  directory holding the sandbox roots (default "
      "$HOME/" DEFAULT_BASE_DIR ")\n"
      "  -M/-m <source/target>  directory to mount (bind) inside the sandbox\n"
      "    Multiple directories can be specified and each of them will be "
      "mounted readonly.\n"
      "    The -M option specifies which directory to mount, the -m option "
      "specifies where to\n"
      "  -y  launch without asking for confirmation\n"
      "  -D <debug-file> if set, debug info will be printed to this file\n"
      "  @FILE  read newline-separated arguments from FILE\n"
      "  --  application to launch inside the sandbox\n");
  exit(EXIT_FAILURE);
}

static void ValidateIsAbsolutePath(char *path, char *program_name, char flag) {
  if (path[0] != '/') {
    Usage(program_name, "The -%c option must be used with absolute paths only.",
          flag);
  }
}


void SplitShareList(const std::string& list, std::set<std::string>* shares) {
  size_t start = 0;
  while (start <= list.size()) {
    size_t end = list.find(',', start);
    if (end == std::string::npos) {
      end = list.size();
    }
    if (end > start) {
      shares->insert(list.substr(start, end - start));
    }
    start = end + 1;
  }
}


// Parses command line flags from an argv array and puts the results into an
// Options structure passed in as an argument.
static void ParseCommandLine(unique_ptr<vector<char *>> args) {
  extern char *optarg;
  extern int optind, optopt;
  int c;

  while ((c = getopt(args->size(), args->data(), ":s:b:M:m:yD:")) != -1) {
    switch (c) {
    case 's':
      SplitShareList(optarg, &opt.shares);
      break;
    case 'b':
      if (opt.base_dir.empty()) {
        ValidateIsAbsolutePath(optarg, args->front(), static_cast<char>(c));
        opt.base_dir.assign(optarg);
      } else {
        Usage(args->front(),
              "Multiple base directories (-b) specified, expected one.");
      }
      break;
    case 'M':
      ValidateIsAbsolutePath(optarg, args->front(), static_cast<char>(c));
      opt.bind_mount_sources.emplace_back(optarg);
      // Mounted at the same path unless -m follows
      opt.bind_mount_targets.emplace_back(optarg);
      break;
    case 'm':
      ValidateIsAbsolutePath(optarg, args->front(), static_cast<char>(c));
      if (opt.bind_mount_sources.empty()) {
        Usage(args->front(), "The -m option must follow a -M option.");
      }
      opt.bind_mount_targets.back().assign(optarg);
      break;
    case 'y':
      opt.assume_yes = true;
      break;
    case 'D':
      if (IsolatorEnableLog(std::string(optarg)) < 0) {
        Usage(args->front(), "%s", IsolatorGetErrorMsg());
      }
      opt.debug_path.assign(optarg);
      break;
    case '?':
      Usage(args->front(), "Unrecognized argument: -%c (%d)", optopt, optind);
      break;
    case ':':
      Usage(args->front(), "Flag -%c requires an argument", optopt);
      break;
    }
  }

  const int remaining = static_cast<int>(args->size()) - optind;
  if (remaining > 1) {
    Usage(args->front(), "Expected exactly one application name.");
  }
  if (remaining == 1) {
    opt.app_name.assign((*args)[optind]);
  }
}

// Expands a single argument, expanding options @filename to read in the content
// of the file and add it to the list of processed arguments.
static unique_ptr<vector<char *>>
ExpandArgument(unique_ptr<vector<char *>> expanded, char *arg) {
  if (arg[0] == '@') {
    const char *filename = arg + 1; // strip off the '@'.
    ifstream f(filename);

    if (!f.is_open()) {
      DIE("opening argument file %s failed", filename);
    }

    for (std::string line; std::getline(f, line);) {
      if (!line.empty()) {
        expanded = ExpandArgument(std::move(expanded), strdup(line.c_str()));
      }
    }

    if (f.bad()) {
      DIE("error while reading from argument file %s", filename);
    }
  } else {
    expanded->push_back(arg);
  }

  return expanded;
}

// Pre-processes an argument list, expanding options @filename to read in the
// content of the file and add it to the list of arguments. Stops expanding
// arguments once it encounters "--".
static unique_ptr<vector<char *>> ExpandArguments(const vector<char *> &args) {
  unique_ptr<vector<char *>> expanded(new vector<char *>());
  expanded->reserve(args.size());
  for (auto arg = args.begin(); arg != args.end(); ++arg) {
    if (strcmp(*arg, "--") != 0) {
      expanded = ExpandArgument(std::move(expanded), *arg);
    } else {
      expanded->insert(expanded->end(), arg, args.end());
      break;
    }
  }
  return expanded;
}

void ParseOptions(int argc, char *argv[]) {
  vector<char *> args(argv, argv + argc);
  ParseCommandLine(ExpandArguments(args));

  if (opt.app_name.empty()) {
    Usage(args.front(), "No application specified.");
  }
  // The name also names the sandbox directory
  if (opt.app_name.find('/') != std::string::npos ||
      opt.app_name == "." || opt.app_name == "..") {
    Usage(args.front(), "Invalid application name: %s", opt.app_name.c_str());
  }

  if (opt.base_dir.empty()) {
    const std::string home = GetHomeDir();
    if (home.empty()) {
      Usage(args.front(), "Could not find the home directory, use -b.");
    }
    opt.base_dir = home + "/" DEFAULT_BASE_DIR;
  }
}
