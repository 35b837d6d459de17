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

#ifndef SRC_MAIN_TOOLS_ISOLATOR_OPTIONS_H_
#define SRC_MAIN_TOOLS_ISOLATOR_OPTIONS_H_

#include <set>
#include <string>
#include <vector>

// Below $HOME unless -b is given
#define DEFAULT_BASE_DIR ".hackeros/isolator"

// Options parsing result.
struct Options {
  // Application to launch (--)
  std::string app_name;
  // Share tokens, kept verbatim (-s)
  std::set<std::string> shares;
  // Directory holding one sandbox root per application (-b)
  std::string base_dir;
  // Do not ask before launching (-y)
  bool assume_yes = false;
  // Print debugging messages (-D)
  std::string debug_path;
  // Source of files or directories to explicitly bind mount in the sandbox (-M)
  std::vector<std::string> bind_mount_sources;
  // Target of files or directories to explicitly bind mount in the sandbox (-m)
  std::vector<std::string> bind_mount_targets;
};

extern struct Options opt;

// Handles parsing all command line flags and populates the global opt struct.
void ParseOptions(int argc, char *argv[]);

// Adds the comma separated share tokens of `list` to `shares`. Empty tokens
// are dropped, everything else is kept as written.
void SplitShareList(const std::string& list, std::set<std::string>* shares);

#endif  // SRC_MAIN_TOOLS_ISOLATOR_OPTIONS_H_
