/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Requesting administrative privileges via pkexec
 */

#include "PrivilegeEscalator.hpp"
#include "Exceptions.hpp"
#include "Log.hpp"
#include "ProcessSpawner.hpp"
#include <unistd.h>

namespace RebaseKit {

PkexecEscalator::PkexecEscalator()
    : root{geteuid() == 0} {
}

ElevationResult PkexecEscalator::requestElevatedPrivileges() {
    if (root) {
        rklog.debug("Running as root, no authorization necessary.");
        return {true, ""};
    }
    try {
        std::string pkexec = ForkExecSpawner::findProgram("pkexec");
        rklog.debug("Authorization will be requested by ", pkexec, ".");
    } catch (const ExecutionException &e) {
        rklog.error(e.what());
        return {false, "Administrative privileges are required, but pkexec is not available."};
    }
    return {true, ""};
}

Command PkexecEscalator::elevate(const Command& command) const {
    if (root)
        return command;
    // pkexec resets the environment; pass the program already resolved against the fixed search path
    Command elevated{"pkexec", ForkExecSpawner::findProgram(command.at(0))};
    elevated.insert(elevated.end(), command.begin() + 1, command.end());
    return elevated;
}

std::optional<std::string> PkexecEscalator::authorizationFailure(int exitCode) const {
    if (root)
        return std::nullopt;
    // Exit codes as documented in pkexec(1)
    switch (exitCode) {
    case 126:
        return "Authentication dialog was dismissed.";
    case 127:
        return "Not authorized to run " + ALLOWED_PROGRAM + " with administrative privileges.";
    default:
        return std::nullopt;
    }
}

} // namespace RebaseKit
