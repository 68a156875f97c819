/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Execution of external programs as argument vectors. There is no shell
  involved at any point: the program is resolved against a fixed search
  path and started with execve.
 */

#ifndef R_K_PROCESSSPAWNER_H
#define R_K_PROCESSSPAWNER_H

#include "Command.hpp"
#include <functional>
#include <string>

namespace RebaseKit {

using LineCallback = std::function<void(const std::string& line)>;

class ProcessSpawner {
public:
    virtual ~ProcessSpawner() = default;

    /**
     * @brief Run a command until it exits
     * @param command argument vector; command[0] is the program name
     * @param onLine called for each line of the combined stdout / stderr stream, in arrival order
     * @return exit status of the program, 128 + signal number if it was killed by a signal
     *
     * Throws an ExecutionException if the program can't be started at all.
     */
    virtual int spawn(const Command& command, const LineCallback& onLine) = 0;
};

class ForkExecSpawner : public ProcessSpawner {
public:
    static constexpr const char* SEARCH_PATH = "/usr/bin:/usr/sbin:/bin:/sbin";

    int spawn(const Command& command, const LineCallback& onLine) override;

    /**
     * @brief Resolve a program name against SEARCH_PATH; names containing a slash are used as is.
     */
    static std::string findProgram(const std::string& name);
};

} // namespace RebaseKit

#endif // R_K_PROCESSSPAWNER_H
