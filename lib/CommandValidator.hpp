/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Allow-list and pattern checks for commands and image references. All
  checks happen before anything is spawned; failures are reported as
  ValidationException and are safe to be shown to the user.
 */

#ifndef R_K_COMMANDVALIDATOR_H
#define R_K_COMMANDVALIDATOR_H

#include "Command.hpp"
#include "RegistryAllowList.hpp"
#include <cstddef>
#include <string>

namespace RebaseKit {

class CommandValidator {
public:
    static constexpr std::size_t MAX_REFERENCE_LENGTH = 512;

    explicit CommandValidator(RegistryAllowList allowList = RegistryAllowList::defaults());
    virtual ~CommandValidator() = default;

    /**
     * @brief Check a command before execution
     * @param command argument vector
     *
     * Throws a ValidationException if argv[0] isn't the allow-listed program, the subcommand
     * isn't supported or any argument contains a shell metacharacter. Quoting an argument
     * doesn't make it acceptable.
     */
    static void validate(const Command& command);

    /**
     * @brief Check a user supplied image reference, e.g. "ghcr.io/ublue-os/bluefin:stable"
     * @param ref image reference without transport prefix
     *
     * The checks are done in the following order: length, suspicious patterns, registry and
     * path allow-list, tag / digest format and finally validate() with the reference embedded
     * as the argument of a rebase command.
     */
    void validateImageReference(const std::string& ref) const;

    const RegistryAllowList& getAllowList() const { return allowList; }
private:
    RegistryAllowList allowList;
};

} // namespace RebaseKit

#endif // R_K_COMMANDVALIDATOR_H
