/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  A Command is the argument vector of a system mutation. It is never joined
  into a shell string for execution; toDisplayString() exists for logs,
  confirmations and the history ledger only.
 */

#ifndef R_K_COMMAND_H
#define R_K_COMMAND_H

#include <string>
#include <vector>

namespace RebaseKit {

using Command = std::vector<std::string>;

// The only program which may ever appear as argv[0]
inline const std::string ALLOWED_PROGRAM = "rpm-ostree";

std::string toDisplayString(const Command& command);

} // namespace RebaseKit

#endif // R_K_COMMAND_H
