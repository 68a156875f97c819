/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

#include "ExecutionEngine.hpp"
#include "PrivilegeEscalator.hpp"
#include "TestSupport.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

namespace {

using RebaseKit::Command;
using RebaseKit::ErrorClassifier;
using RebaseKit::ExecutionEngine;
using RebaseKit::ExecutionResult;
using RebaseKit::RuntimeErrorKind;
using namespace RebaseKit::Test;

const Command kRebase{"rpm-ostree", "rebase", "ostree-unverified-registry:ghcr.io/ublue-os/bluefin:stable"};

void TestSuccess() {
  ScriptedSpawner spawner;
  spawner.lines = {"Pulling manifest", "Staging deployment... done"};
  ScriptedEscalator escalator;
  ExecutionEngine engine{spawner, escalator};

  std::vector<std::string> streamed;
  ExecutionResult result = engine.executeWithProgress(kRebase, [&](const std::string& line) { streamed.push_back(line); });
  assert(result.success);
  assert(result.exitCode == 0);
  assert(result.errorKind == RuntimeErrorKind::None);
  assert(result.output == spawner.lines);
  assert(streamed == spawner.lines);
  assert(spawner.calls.size() == 1 && spawner.calls[0] == kRebase);
}

void TestFailureIsClassified() {
  ScriptedSpawner spawner;
  spawner.lines = {"Pulling manifest", "error: Unable to connect to ghcr.io"};
  spawner.exitCode = 1;
  ScriptedEscalator escalator;
  ExecutionEngine engine{spawner, escalator};

  ExecutionResult result = engine.executeWithProgress(kRebase, nullptr);
  assert(!result.success);
  assert(result.exitCode == 1);
  assert(result.errorKind == RuntimeErrorKind::Network);
  assert(result.output.size() == 2);
}

void TestCustomClassifier() {
  ScriptedSpawner spawner;
  spawner.lines = {"error: upstream proxy error"};
  spawner.exitCode = 1;
  ScriptedEscalator escalator;
  ErrorClassifier classifier;
  classifier.setKeywords(RuntimeErrorKind::Timeout, {"proxy error"});
  ExecutionEngine engine{spawner, escalator, classifier};

  assert(engine.executeWithProgress(kRebase, nullptr).errorKind == RuntimeErrorKind::Timeout);
}

void TestInvalidCommandIsNeverSpawned() {
  ScriptedSpawner spawner;
  ScriptedEscalator escalator;
  ExecutionEngine engine{spawner, escalator};

  ExecutionResult result = engine.executeWithProgress({"rm", "-rf", "/"}, nullptr);
  assert(!result.success);
  assert(result.errorKind == RuntimeErrorKind::InvalidCommand);
  assert(result.output.size() == 1);
  assert(result.output[0].find("not allowed") != std::string::npos);

  result = engine.executePrivileged({"rpm-ostree", "rebase", "x;reboot"}, nullptr);
  assert(result.errorKind == RuntimeErrorKind::InvalidCommand);
  assert(spawner.calls.empty());
}

void TestProgramCannotStart() {
  ScriptedSpawner spawner;
  spawner.failToStart = true;
  ScriptedEscalator escalator;
  ExecutionEngine engine{spawner, escalator};

  ExecutionResult result = engine.executeWithProgress(kRebase, nullptr);
  assert(!result.success);
  assert(result.exitCode == 127);
  assert(result.errorKind == RuntimeErrorKind::Unknown);
  assert(result.output.back().find("failed") != std::string::npos);
}

void TestPrivilegesDenied() {
  ScriptedSpawner spawner;
  ScriptedEscalator escalator;
  escalator.result = {false, "Authentication dialog was dismissed."};
  ExecutionEngine engine{spawner, escalator};

  ExecutionResult result = engine.executePrivileged(kRebase, nullptr);
  assert(!result.success);
  assert(result.errorKind == RuntimeErrorKind::Auth);
  assert(result.output == std::vector<std::string>{"Authentication dialog was dismissed."});
  assert(escalator.requests == 1);
  assert(spawner.calls.empty());
}

void TestPrivilegesGranted() {
  ScriptedSpawner spawner;
  spawner.lines = {"Transaction complete"};
  ScriptedEscalator escalator;
  ExecutionEngine engine{spawner, escalator};

  ExecutionResult result = engine.executePrivileged(kRebase, nullptr);
  assert(result.success);
  assert(escalator.requests == 1);
  assert(spawner.calls.size() == 1);
}

void TestPrivilegedCommandIsElevated() {
  ScriptedSpawner spawner;
  ScriptedEscalator escalator;
  escalator.wrapper = {"pkexec"};
  ExecutionEngine engine{spawner, escalator};

  ExecutionResult result = engine.executePrivileged(kRebase, nullptr);
  assert(result.success);
  assert(spawner.calls.size() == 1);
  assert(spawner.calls[0].size() == kRebase.size() + 1);
  assert(spawner.calls[0][0] == "pkexec");
  assert(spawner.calls[0][1] == "rpm-ostree");

  // Validation applies to the command itself, never to the wrapped one
  result = engine.executePrivileged({"pkexec", "rpm-ostree", "status"}, nullptr);
  assert(result.errorKind == RuntimeErrorKind::InvalidCommand);
  assert(spawner.calls.size() == 1);

  // Unprivileged execution is never wrapped
  engine.executeWithProgress(kRebase, nullptr);
  assert(spawner.calls.back() == kRebase);
}

void TestAuthorizationRefusedWhenStarting() {
  ScriptedSpawner spawner;
  spawner.lines = {"Error executing command as another user: Request dismissed"};
  spawner.exitCode = 126;
  ScriptedEscalator escalator;
  escalator.refusedExitCode = 126;
  ExecutionEngine engine{spawner, escalator};

  ExecutionResult result = engine.executePrivileged(kRebase, nullptr);
  assert(!result.success);
  assert(result.errorKind == RuntimeErrorKind::Auth);
  assert(result.output.back() == "Authentication dialog was dismissed.");

  // The same exit status of an unprivileged command is an ordinary failure
  result = engine.executeWithProgress(kRebase, nullptr);
  assert(result.errorKind == RuntimeErrorKind::Unknown);
  assert(result.output.size() == 1);
}

void TestPkexecEscalator() {
  RebaseKit::PkexecEscalator escalator;
  const Command command{"sh", "-c", "exit 0"};

  if (geteuid() == 0) {
    assert(escalator.requestElevatedPrivileges().granted);
    assert(escalator.elevate(command) == command);
    assert(!escalator.authorizationFailure(126));
    return;
  }

  auto elevation = escalator.requestElevatedPrivileges();
  if (!elevation.granted)
    assert(elevation.error.find("pkexec") != std::string::npos);

  Command elevated = escalator.elevate(command);
  assert(elevated.size() == 4);
  assert(elevated[0] == "pkexec");
  assert(elevated[1].front() == '/');
  assert(elevated[1].substr(elevated[1].rfind('/')) == "/sh");
  assert(elevated[2] == "-c" && elevated[3] == "exit 0");

  assert(escalator.authorizationFailure(126)->find("dismissed") != std::string::npos);
  assert(escalator.authorizationFailure(127));
  assert(!escalator.authorizationFailure(0));
  assert(!escalator.authorizationFailure(1));
}

} // namespace

int main() {
  TestSuccess();
  TestFailureIsClassified();
  TestCustomClassifier();
  TestInvalidCommandIsNeverSpawned();
  TestProgramCannotStart();
  TestPrivilegesDenied();
  TestPrivilegesGranted();
  TestPrivilegedCommandIsElevated();
  TestAuthorizationRefusedWhenStarting();
  TestPkexecEscalator();

  std::cout << "rebasekit_execution_engine: pass\n";
  return 0;
}
