/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Runs validated commands and classifies their outcome
 */

#include "ExecutionEngine.hpp"
#include "CommandValidator.hpp"
#include "Exceptions.hpp"
#include "Log.hpp"
#include "PrivilegeEscalator.hpp"
#include <optional>
#include <utility>

namespace RebaseKit {

ExecutionEngine::ExecutionEngine(ProcessSpawner& spawner, PrivilegeEscalator& escalator, ErrorClassifier classifier)
    : spawner{spawner}, escalator{escalator}, classifier{std::move(classifier)} {
}

bool ExecutionEngine::checkCommand(const Command& command, ExecutionResult& result) const {
    try {
        CommandValidator::validate(command);
    } catch (const ValidationException &e) {
        rklog.error("Refusing to execute command: ", e.what());
        result.errorKind = RuntimeErrorKind::InvalidCommand;
        result.output.push_back(e.what());
        return false;
    }
    return true;
}

ExecutionResult ExecutionEngine::run(const Command& command, const LineCallback& onLine, bool privileged) {
    ExecutionResult result;
    try {
        Command argv = privileged ? escalator.elevate(command) : command;
        result.exitCode = spawner.spawn(argv, [&](const std::string& line) {
            result.output.push_back(line);
            if (onLine)
                onLine(line);
        });
    } catch (const ExecutionException &e) {
        rklog.error(e.what());
        result.exitCode = e.returncode;
        result.output.push_back(e.what());
        result.errorKind = RuntimeErrorKind::Unknown;
        return result;
    }

    result.success = result.exitCode == 0;
    if (result.success) {
        result.errorKind = RuntimeErrorKind::None;
        return result;
    }
    std::optional<std::string> denied;
    if (privileged)
        denied = escalator.authorizationFailure(result.exitCode);
    if (denied) {
        rklog.error("Not executing `", toDisplayString(command), "`: ", *denied);
        result.output.push_back(*denied);
        result.errorKind = RuntimeErrorKind::Auth;
    } else {
        result.errorKind = classifier.classify(result.output);
        rklog.info("Command failed with exit status ", result.exitCode, ", classified as ",
                   toString(result.errorKind), ".");
    }
    return result;
}

ExecutionResult ExecutionEngine::executeWithProgress(const Command& command, const LineCallback& onLine) {
    ExecutionResult result;
    if (!checkCommand(command, result))
        return result;
    return run(command, onLine, false);
}

ExecutionResult ExecutionEngine::executePrivileged(const Command& command, const LineCallback& onLine) {
    ExecutionResult result;
    if (!checkCommand(command, result))
        return result;

    ElevationResult elevation = escalator.requestElevatedPrivileges();
    if (!elevation.granted) {
        result.errorKind = RuntimeErrorKind::Auth;
        result.output.push_back(elevation.error.empty() ? std::string{"Authorization denied."} : elevation.error);
        rklog.error("Not executing `", toDisplayString(command), "`: ", result.output.back());
        return result;
    }
    return run(command, onLine, true);
}

} // namespace RebaseKit
