/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Requesting administrative privileges for a system modification. The
  actual authentication dialog is provided by an external agent.
 */

#ifndef R_K_PRIVILEGEESCALATOR_H
#define R_K_PRIVILEGEESCALATOR_H

#include "Command.hpp"
#include <optional>
#include <string>

namespace RebaseKit {

struct ElevationResult {
    bool granted = false;
    std::string error;
};

class PrivilegeEscalator {
public:
    virtual ~PrivilegeEscalator() = default;
    virtual ElevationResult requestElevatedPrivileges() = 0;

    /**
     * @brief Argument vector running an already validated command with the privileges granted
     * by requestElevatedPrivileges()
     */
    virtual Command elevate(const Command& command) const { return command; }

    /**
     * @brief Reason if the exit status of an elevated command means that the escalation
     * mechanism refused to run it
     */
    virtual std::optional<std::string> authorizationFailure(int exitCode) const {
        (void)exitCode;
        return std::nullopt;
    }
};

/**
 * @brief Runs commands through pkexec(1) when not running as root; polkit asks the registered
 * authentication agent for the credentials when the command is started. root runs commands
 * directly.
 */
class PkexecEscalator : public PrivilegeEscalator {
public:
    PkexecEscalator();
    ElevationResult requestElevatedPrivileges() override;
    Command elevate(const Command& command) const override;
    std::optional<std::string> authorizationFailure(int exitCode) const override;
private:
    bool root;
};

} // namespace RebaseKit

#endif // R_K_PRIVILEGEESCALATOR_H
