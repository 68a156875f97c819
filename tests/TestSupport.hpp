/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Scripted collaborators shared by the test programs
 */

#ifndef R_K_TESTSUPPORT_H
#define R_K_TESTSUPPORT_H

#include "Command.hpp"
#include "ConfirmationGate.hpp"
#include "Deployment.hpp"
#include "Exceptions.hpp"
#include "PrivilegeEscalator.hpp"
#include "ProcessSpawner.hpp"
#include "ProgressTracker.hpp"
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace RebaseKit::Test {

// Replays a fixed output and exit status; records every command it was asked to run
class ScriptedSpawner : public ProcessSpawner {
public:
    std::vector<std::string> lines;
    int exitCode = 0;
    // Simulates a program which can't be started
    bool failToStart = false;
    // Run before the output is replayed, i.e. while the "process" is running
    std::function<void()> whileRunning;
    std::vector<Command> calls;

    int spawn(const Command& command, const LineCallback& onLine) override {
        calls.push_back(command);
        if (failToStart)
            throw ExecutionException{"Calling " + command[0] + " failed: No such file or directory", 127, ""};
        if (whileRunning)
            whileRunning();
        for (auto& line: lines) {
            if (onLine)
                onLine(line);
        }
        return exitCode;
    }
};

class ScriptedEscalator : public PrivilegeEscalator {
public:
    ElevationResult result{true, ""};
    int requests = 0;
    // Prepended to elevated commands
    Command wrapper;
    // Exit status reported as refused authorization
    std::optional<int> refusedExitCode;

    ElevationResult requestElevatedPrivileges() override {
        requests++;
        return result;
    }
    Command elevate(const Command& command) const override {
        Command elevated = wrapper;
        elevated.insert(elevated.end(), command.begin(), command.end());
        return elevated;
    }
    std::optional<std::string> authorizationFailure(int exitCode) const override {
        if (refusedExitCode && *refusedExitCode == exitCode)
            return std::string{"Authentication dialog was dismissed."};
        return std::nullopt;
    }
};

// Answers every confirmation right away
class AnsweringPrompt : public ConfirmationPrompt {
public:
    explicit AnsweringPrompt(bool accept) : accept{accept} {}
    std::vector<OperationConfirmation> presented;

    void present(const OperationConfirmation& confirmation, ConfirmationGate& gate) override {
        presented.push_back(confirmation);
        if (accept)
            gate.confirm();
        else
            gate.cancel();
    }
private:
    bool accept;
};

// Keeps the gate open until the test resolves it
class DeferredPrompt : public ConfirmationPrompt {
public:
    ConfirmationGate* gate = nullptr;
    std::vector<OperationConfirmation> presented;

    void present(const OperationConfirmation& confirmation, ConfirmationGate& g) override {
        presented.push_back(confirmation);
        gate = &g;
    }
};

class RecordingProgress : public ProgressSink {
public:
    std::vector<std::string> operations;
    std::vector<std::string> lines;
    std::vector<std::pair<bool, std::string>> results;

    void started(const std::string& operation) override { operations.push_back(operation); }
    void line(const std::string& text) override { lines.push_back(text); }
    void finished(bool success, const std::string& message) override { results.emplace_back(success, message); }
};

class FixedStatusReader : public StatusReader {
public:
    explicit FixedStatusReader(ProcessSpawner& spawner) : StatusReader{spawner} {}
    std::string json;
    bool unavailable = false;
    int reads = 0;

    std::vector<Deployment> read() override {
        reads++;
        if (unavailable)
            throw StatusException{StatusError::StatusUnavailable, "Deployment status unavailable: rpm-ostree not found"};
        return parseStatus(json);
    }
};

// Removed with all its content when going out of scope
class TemporaryDirectory {
public:
    TemporaryDirectory() {
        std::string pattern = (std::filesystem::temp_directory_path() / "rebasekit-test-XXXXXX").native();
        if (mkdtemp(pattern.data()) == nullptr)
            throw std::runtime_error{"Could not create temporary directory."};
        dir = pattern;
    }
    ~TemporaryDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
    TemporaryDirectory(const TemporaryDirectory&) = delete;
    void operator=(const TemporaryDirectory&) = delete;
    const std::filesystem::path& path() const { return dir; }
private:
    std::filesystem::path dir;
};

// Booted deployment first, followed by the previous one and an older pinned one
inline const std::string STATUS_JSON = R"({
  "deployments": [
    {
      "checksum": "a1b2c3d4e5f60718293a4b5c6d7e8f90a1b2c3d4e5f60718293a4b5c6d7e8f90",
      "origin": "ostree-unverified-registry:ghcr.io/ublue-os/bluefin-dx:stable",
      "version": "41.20241020",
      "timestamp": 1729425600,
      "booted": true,
      "pinned": false
    },
    {
      "checksum": "b2c3d4e5f60718293a4b5c6d7e8f90a1b2c3d4e5f60718293a4b5c6d7e8f90a1",
      "origin": "ostree-unverified-registry:ghcr.io/ublue-os/bluefin:stable",
      "version": "41.20241013",
      "timestamp": 1728820800,
      "booted": false,
      "pinned": false
    },
    {
      "checksum": "c3d4e5f60718293a4b5c6d7e8f90a1b2c3d4e5f60718293a4b5c6d7e8f90a1b2",
      "origin": "ostree-unverified-registry:quay.io/fedora/fedora-silverblue:41",
      "version": "41.20241001",
      "timestamp": 1727784000,
      "booted": false,
      "pinned": true
    }
  ]
})";

inline const std::string BOOTED_ID = "a1b2c3d4e5f6";
inline const std::string PREVIOUS_ID = "b2c3d4e5f607";
inline const std::string PINNED_ID = "c3d4e5f60718";

} // namespace RebaseKit::Test

#endif // R_K_TESTSUPPORT_H
