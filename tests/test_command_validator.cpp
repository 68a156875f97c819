/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

#include "CommandValidator.hpp"
#include "Exceptions.hpp"
#include "RegistryAllowList.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using RebaseKit::Command;
using RebaseKit::CommandValidator;
using RebaseKit::RegistryAllowList;
using RebaseKit::ValidationError;
using RebaseKit::ValidationException;

// Returns the message of the expected ValidationException
std::string ExpectRejected(const std::function<void()>& check, ValidationError expected) {
  try {
    check();
  } catch (const ValidationException& e) {
    assert(e.kind == expected);
    return e.what();
  }
  assert(false && "expected a ValidationException");
  return {};
}

void TestAllowedProgramAndSubcommands() {
  CommandValidator::validate({"rpm-ostree", "status"});
  CommandValidator::validate({"rpm-ostree", "rollback"});
  CommandValidator::validate({"rpm-ostree", "deploy", "b2c3d4e5f60718293a4b"});
  CommandValidator::validate({"rpm-ostree", "rebase", "ostree-unverified-registry:ghcr.io/ublue-os/bluefin:stable"});
  CommandValidator::validate({"rpm-ostree", "cancel"});
}

void TestDisallowedProgram() {
  std::string message = ExpectRejected([] { CommandValidator::validate({"rm", "-rf", "/"}); },
                                       ValidationError::DisallowedProgram);
  assert(message.find("not allowed") != std::string::npos);

  message = ExpectRejected([] { CommandValidator::validate({}); }, ValidationError::DisallowedProgram);
  assert(message.find("Empty command") != std::string::npos);

  ExpectRejected([] { CommandValidator::validate({"/usr/bin/rpm-ostree", "status"}); },
                 ValidationError::DisallowedProgram);
}

void TestUnsupportedSubcommand() {
  std::string message = ExpectRejected([] { CommandValidator::validate({"rpm-ostree", "install", "vim"}); },
                                       ValidationError::UnsupportedSubcommand);
  assert(message.find("Unsupported rpm-ostree subcommand") != std::string::npos);

  ExpectRejected([] { CommandValidator::validate({"rpm-ostree"}); }, ValidationError::UnsupportedSubcommand);
}

void TestDangerousCharacters() {
  for (const std::string arg: {"foo;rm", "a|b", "a&b", "`id`", "$HOME", "a>b", "a<b", "a\nb"}) {
    std::string message = ExpectRejected([&] { CommandValidator::validate({"rpm-ostree", "rebase", arg}); },
                                         ValidationError::DangerousCharacter);
    assert(message.find("dangerous character") != std::string::npos);
  }

  // Quoting doesn't help
  std::string message = ExpectRejected([] { CommandValidator::validate({"rpm-ostree", "rebase", "'foo;bar'"}); },
                                       ValidationError::DangerousCharacter);
  assert(message.find("Quoted argument") != std::string::npos);
}

void TestValidImageReferences() {
  CommandValidator validator;
  validator.validateImageReference("ghcr.io/ublue-os/bluefin:stable");
  validator.validateImageReference("ghcr.io/ublue-os/bluefin-dx:stable");
  validator.validateImageReference("ghcr.io/ublue-os/bazzite-deck:latest");
  validator.validateImageReference("quay.io/fedora/fedora-silverblue:41");
  validator.validateImageReference("ghcr.io/ublue-os/aurora@sha256:" + std::string(64, 'a'));
}

void TestReferenceLength() {
  CommandValidator validator;
  std::string ref = "ghcr.io/ublue-os/bluefin:" + std::string(CommandValidator::MAX_REFERENCE_LENGTH, 'a');
  std::string message = ExpectRejected([&] { validator.validateImageReference(ref); }, ValidationError::TooLong);
  assert(message.find("too long") != std::string::npos);
}

void TestSuspiciousPatterns() {
  CommandValidator validator;
  for (const std::string ref: {"ghcr.io/ublue-os/bluefin:stable; rm -rf /", "ghcr.io/ublue-os/bluefin:$(whoami)",
                               "ghcr.io/ublue-os/../../etc/passwd", "docker://ghcr.io/ublue-os/bluefin:stable",
                               "-rf", "/etc/passwd", "ghcr.io//ublue-os/bluefin:stable",
                               "docker:ghcr.io/ublue-os/bluefin:stable", "ghcr.io/ublue-os/bluefin:stable\t",
                               "ghcr.io/ublue-os/bluefin:st\xc3\xa4" "ble"}) {
    std::string message = ExpectRejected([&] { validator.validateImageReference(ref); },
                                         ValidationError::SuspiciousPattern);
    assert(message.find("suspicious pattern") != std::string::npos);
  }
}

void TestDisallowedRegistryOrPath() {
  CommandValidator validator;
  for (const std::string ref: {"docker.io/library/ubuntu:latest", "ghcr.io/evil/bluefin:stable",
                               "ghcr.io/ublue-os/bluefinx:stable", "ghcr.io/ublue-os/Bluefin:stable",
                               "ghcr.io/ublue-os/bluefin", "ghcr.io/ublue-os/bluefin@sha256:abc",
                               "ghcr.io/ublue-os/bluefin:-stable", "localhost:5000/ublue-os/bluefin:stable",
                               "bluefin", ""}) {
    std::string message = ExpectRejected([&] { validator.validateImageReference(ref); },
                                         ValidationError::DisallowedRegistryOrPath);
    assert(message.find("not allowed") != std::string::npos);
  }
}

void TestCustomAllowList() {
  RegistryAllowList allowList{{"registry.example.com/os/desktop", "Registry.Example.com/os/server/"}};
  assert(allowList.hasRegistry("registry.example.com"));
  assert(allowList.hasRegistry("REGISTRY.example.com"));
  assert(!allowList.hasRegistry("ghcr.io"));
  assert(allowList.isPathAllowed("registry.example.com", "os/desktop"));
  assert(allowList.isPathAllowed("registry.example.com", "os/desktop-nvidia"));
  assert(allowList.isPathAllowed("registry.example.com", "os/server"));
  assert(!allowList.isPathAllowed("registry.example.com", "os/desktopx"));
  assert(!allowList.isPathAllowed("registry.example.com", "os"));
  assert(allowList.permittedPaths("registry.example.com").size() == 2);

  CommandValidator validator{allowList};
  validator.validateImageReference("registry.example.com/os/desktop:1.0");
  ExpectRejected([&] { validator.validateImageReference("ghcr.io/ublue-os/bluefin:stable"); },
                 ValidationError::DisallowedRegistryOrPath);

  bool thrown = false;
  try {
    allowList.allow("no-path");
  } catch (const std::invalid_argument&) {
    thrown = true;
  }
  assert(thrown);
}

void TestDisplayString() {
  Command command{"rpm-ostree", "rebase", "ostree-unverified-registry:ghcr.io/ublue-os/bluefin:stable"};
  assert(RebaseKit::toDisplayString(command) ==
         "rpm-ostree rebase ostree-unverified-registry:ghcr.io/ublue-os/bluefin:stable");
}

} // namespace

int main() {
  TestAllowedProgramAndSubcommands();
  TestDisallowedProgram();
  TestUnsupportedSubcommand();
  TestDangerousCharacters();
  TestValidImageReferences();
  TestReferenceLength();
  TestSuspiciousPatterns();
  TestDisallowedRegistryOrPath();
  TestCustomAllowList();
  TestDisplayString();

  std::cout << "rebasekit_command_validator: pass\n";
  return 0;
}
