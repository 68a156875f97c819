/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Runs validated commands and classifies their outcome. Calls block for
  the whole lifetime of the external process; there is neither a timeout
  nor any retry.
 */

#ifndef R_K_EXECUTIONENGINE_H
#define R_K_EXECUTIONENGINE_H

#include "Command.hpp"
#include "ErrorClassifier.hpp"
#include "ProcessSpawner.hpp"
#include <string>
#include <vector>

namespace RebaseKit {

class PrivilegeEscalator;

struct ExecutionResult {
    bool success = false;
    int exitCode = -1;
    std::vector<std::string> output;
    RuntimeErrorKind errorKind = RuntimeErrorKind::Unknown;
};

class ExecutionEngine {
public:
    ExecutionEngine(ProcessSpawner& spawner, PrivilegeEscalator& escalator,
                    ErrorClassifier classifier = ErrorClassifier{});
    virtual ~ExecutionEngine() = default;

    /**
     * @brief Validate and run a command
     * @param command argument vector
     * @param onLine called for each output line in arrival order, from the calling thread
     *
     * A command failing validation is never spawned; the result has errorKind InvalidCommand
     * and the validation message as single output line.
     */
    ExecutionResult executeWithProgress(const Command& command, const LineCallback& onLine);

    /**
     * @brief Same as executeWithProgress, but run the validated command through the privilege
     * escalator; if elevation is denied the command is not spawned and errorKind is Auth.
     */
    ExecutionResult executePrivileged(const Command& command, const LineCallback& onLine);

    const ErrorClassifier& getClassifier() const { return classifier; }
private:
    bool checkCommand(const Command& command, ExecutionResult& result) const;
    ExecutionResult run(const Command& command, const LineCallback& onLine, bool privileged);

    ProcessSpawner& spawner;
    PrivilegeEscalator& escalator;
    ErrorClassifier classifier;
};

} // namespace RebaseKit

#endif // R_K_EXECUTIONENGINE_H
