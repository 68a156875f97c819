/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Background and synchronous task scheduling
 */

#include "Scheduler.hpp"
#include "Log.hpp"
#include <exception>
#include <utility>

namespace RebaseKit {

BackgroundScheduler::~BackgroundScheduler() {
    for (auto& [id, worker]: workers) {
        if (worker.joinable())
            worker.join();
    }
    std::lock_guard<std::mutex> lock{mutex};
    if (!pending.empty())
        rklog.debug("Discarding ", pending.size(), " undelivered callback(s).");
}

void BackgroundScheduler::runInBackground(Task task) {
    std::size_t id = nextWorker++;
    workers.emplace(id, std::thread{[this, id, task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception &e) {
            rklog.error("ERROR: Background task failed: ", e.what());
        }
        deliver([this, id]() { reap(id); });
    }});
}

void BackgroundScheduler::reap(std::size_t worker) {
    auto it = workers.find(worker);
    if (it == workers.end())
        return;
    if (it->second.joinable())
        it->second.join();
    workers.erase(it);
}

void BackgroundScheduler::deliver(Task callback) {
    {
        std::lock_guard<std::mutex> lock{mutex};
        pending.push_back(std::move(callback));
    }
    cv.notify_all();
}

std::size_t BackgroundScheduler::processPending() {
    std::size_t count = 0;
    while (true) {
        Task callback;
        {
            std::lock_guard<std::mutex> lock{mutex};
            if (pending.empty())
                break;
            callback = std::move(pending.front());
            pending.pop_front();
        }
        // Run without holding the lock, the callback may deliver further work
        callback();
        count++;
    }
    return count;
}

void BackgroundScheduler::waitUntil(const std::function<bool()>& predicate) {
    while (!predicate()) {
        Task callback;
        {
            std::unique_lock<std::mutex> lock{mutex};
            cv.wait(lock, [this] { return !pending.empty(); });
            callback = std::move(pending.front());
            pending.pop_front();
        }
        callback();
    }
}

void ImmediateScheduler::runInBackground(Task task) {
    task();
}

void ImmediateScheduler::deliver(Task callback) {
    callback();
}

} // namespace RebaseKit
