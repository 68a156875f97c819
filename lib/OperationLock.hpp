/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Ensures only one system modification is executed at a time, both within
  this process and, via a lock file, across processes.
 */

#ifndef R_K_OPERATIONLOCK_H
#define R_K_OPERATIONLOCK_H

#include <filesystem>
#include <memory>
#include <mutex>

namespace RebaseKit {

class OperationLock;

/**
 * @brief Proof of exclusive execution rights; released on destruction
 *
 * A lease must not outlive the lock it was acquired from.
 */
class OperationLease {
public:
    ~OperationLease();
    OperationLease(const OperationLease&) = delete;
    void operator=(const OperationLease&) = delete;
private:
    friend class OperationLock;
    OperationLease(OperationLock& lock, int lockfile);
    OperationLock& lock;
    int lockfile;
};

class OperationLock {
public:
    /**
     * @param lockfile file to lock with lockf(3); an empty path restricts the lock to this process
     */
    explicit OperationLock(std::filesystem::path lockfile = {});
    OperationLock(const OperationLock&) = delete;
    void operator=(const OperationLock&) = delete;

    /**
     * @brief Acquire the lease without waiting
     * @return nullptr if an operation is already in progress
     */
    std::unique_ptr<OperationLease> tryAcquire();
    bool isHeld() const;
private:
    friend class OperationLease;
    void release(int lockfile);
    std::filesystem::path path;
    mutable std::mutex mutex;
    bool held = false;
};

} // namespace RebaseKit

#endif // R_K_OPERATIONLOCK_H
