/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Decouples long running work from the context owning the orchestrator.
  Background tasks may block; everything passed to deliver() is run in the
  owner's context, in the order it was delivered.
 */

#ifndef R_K_SCHEDULER_H
#define R_K_SCHEDULER_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace RebaseKit {

class Scheduler {
public:
    using Task = std::function<void()>;
    virtual ~Scheduler() = default;
    virtual void runInBackground(Task task) = 0;
    // May be called from any thread
    virtual void deliver(Task callback) = 0;
};

/**
 * @brief Runs every task on a worker thread of its own
 *
 * Delivered callbacks are queued until the owner calls processPending() or waitUntil().
 * A finished worker delivers its own join, so it is released the next time the owner
 * processes deliveries. The destructor joins all workers without running their remaining
 * deliveries.
 */
class BackgroundScheduler : public Scheduler {
public:
    BackgroundScheduler() = default;
    ~BackgroundScheduler() override;
    BackgroundScheduler(const BackgroundScheduler&) = delete;
    void operator=(const BackgroundScheduler&) = delete;

    void runInBackground(Task task) override;
    void deliver(Task callback) override;

    /**
     * @brief Run all callbacks delivered so far
     * @return number of callbacks run
     */
    std::size_t processPending();

    /**
     * @brief Run delivered callbacks as they arrive until the predicate becomes true
     *
     * The predicate is evaluated in the calling thread after each callback.
     */
    void waitUntil(const std::function<bool()>& predicate);

    // Workers not joined yet
    std::size_t workerCount() const { return workers.size(); }
private:
    void reap(std::size_t worker);

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Task> pending;
    // Only accessed from the owner's context
    std::map<std::size_t, std::thread> workers;
    std::size_t nextWorker = 0;
};

/**
 * @brief Runs tasks and callbacks synchronously in the calling thread
 */
class ImmediateScheduler : public Scheduler {
public:
    void runInBackground(Task task) override;
    void deliver(Task callback) override;
};

} // namespace RebaseKit

#endif // R_K_SCHEDULER_H
