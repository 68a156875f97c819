/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Mutual exclusion of system modifications
 */

#include "OperationLock.hpp"
#include "Log.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <unistd.h>
#include <utility>

namespace RebaseKit {

OperationLease::OperationLease(OperationLock& lock, int lockfile) : lock{lock}, lockfile{lockfile} {
}

OperationLease::~OperationLease() {
    lock.release(lockfile);
}

OperationLock::OperationLock(std::filesystem::path lockfile) : path{std::move(lockfile)} {
}

std::unique_ptr<OperationLease> OperationLock::tryAcquire() {
    std::lock_guard<std::mutex> guard{mutex};
    if (held) {
        rklog.debug("Operation lease is already held by this process.");
        return nullptr;
    }

    int lockfile = -1;
    if (!path.empty()) {
        lockfile = open(path.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0600);
        if (lockfile < 0 && (errno == EACCES || errno == EROFS || errno == ENOENT)) {
            rklog.info("Could not create lock file '", path.native(), "': ", strerror(errno),
                       "; locking within this process only.");
        } else if (lockfile < 0) {
            throw std::runtime_error{"Could not create lock file '" + path.native() + "': " + strerror(errno)};
        } else if (lockf(lockfile, F_TLOCK, 0) != 0) {
            int error = errno;
            close(lockfile);
            if (error == EACCES || error == EAGAIN) {
                rklog.info("Another instance of rbkit is already running.");
                return nullptr;
            }
            throw std::runtime_error{"Could not lock '" + path.native() + "': " + strerror(error)};
        }
    }

    held = true;
    return std::unique_ptr<OperationLease>(new OperationLease(*this, lockfile));
}

bool OperationLock::isHeld() const {
    std::lock_guard<std::mutex> guard{mutex};
    return held;
}

void OperationLock::release(int lockfile) {
    std::lock_guard<std::mutex> guard{mutex};
    // Closing the descriptor drops the lockf lock
    if (lockfile >= 0)
        close(lockfile);
    held = false;
}

} // namespace RebaseKit
