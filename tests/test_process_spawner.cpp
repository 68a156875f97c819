/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

#include "Exceptions.hpp"
#include "ProcessSpawner.hpp"

#include <cassert>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

namespace {

using RebaseKit::ExecutionException;
using RebaseKit::ForkExecSpawner;

void TestCombinedOutputInOrder() {
  ForkExecSpawner spawner;
  std::vector<std::string> lines;
  int ret = spawner.spawn({"sh", "-c", "echo first; echo second >&2; printf 'third'; exit 3"},
                          [&lines](const std::string& line) { lines.push_back(line); });
  assert(ret == 3);
  assert((lines == std::vector<std::string>{"first", "second", "third"}));
}

void TestArgumentsAreNotInterpreted() {
  ForkExecSpawner spawner;
  std::vector<std::string> lines;
  int ret = spawner.spawn({"sh", "-c", "printf '%s\\n' \"$1\"", "sh", "a; echo injected"},
                          [&lines](const std::string& line) { lines.push_back(line); });
  assert(ret == 0);
  assert((lines == std::vector<std::string>{"a; echo injected"}));
}

void TestMinimalEnvironment() {
  ForkExecSpawner spawner;
  std::vector<std::string> lines;
  int ret = spawner.spawn({"sh", "-c", "echo \"$LC_ALL\"; read -r line || echo eof"},
                          [&lines](const std::string& line) { lines.push_back(line); });
  assert(ret == 0);
  assert((lines == std::vector<std::string>{"C", "eof"}));
}

void TestTerminatedBySignal() {
  ForkExecSpawner spawner;
  int ret = spawner.spawn({"sh", "-c", "kill -TERM $$"}, nullptr);
  assert(ret == 128 + SIGTERM);
}

void TestMissingProgram() {
  ForkExecSpawner spawner;
  bool thrown = false;
  try {
    spawner.spawn({"rebasekit-no-such-program"}, nullptr);
  } catch (const ExecutionException& e) {
    assert(e.returncode == 127);
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    spawner.spawn({}, nullptr);
  } catch (const ExecutionException&) {
    thrown = true;
  }
  assert(thrown);
}

void TestFindProgram() {
  std::string sh = ForkExecSpawner::findProgram("sh");
  assert(sh.front() == '/');
  assert(sh.size() > 3 && sh.compare(sh.size() - 3, 3, "/sh") == 0);
  assert(ForkExecSpawner::findProgram("/bin/sh") == "/bin/sh");
}

} // namespace

int main() {
  TestCombinedOutputInOrder();
  TestArgumentsAreNotInterpreted();
  TestMinimalEnvironment();
  TestTerminatedBySignal();
  TestMissingProgram();
  TestFindProgram();

  std::cout << "rebasekit_process_spawner: pass\n";
  return 0;
}
