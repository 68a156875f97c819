/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

#include "OperationLock.hpp"
#include "Scheduler.hpp"
#include "TestSupport.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

using RebaseKit::BackgroundScheduler;
using RebaseKit::ImmediateScheduler;
using RebaseKit::OperationLease;
using RebaseKit::OperationLock;
using RebaseKit::Test::TemporaryDirectory;

void TestDeliveriesRunInOwnerThread() {
  const std::thread::id owner = std::this_thread::get_id();
  std::vector<int> delivered;
  std::atomic<bool> workerElsewhere{false};
  // Declared last so its workers are joined first
  BackgroundScheduler scheduler;

  scheduler.runInBackground([&]() {
    workerElsewhere = std::this_thread::get_id() != owner;
    for (int i = 0; i < 5; i++) {
      scheduler.deliver([&delivered, i, owner]() {
        assert(std::this_thread::get_id() == owner);
        delivered.push_back(i);
      });
    }
  });
  scheduler.waitUntil([&delivered] { return delivered.size() == 5; });

  assert(workerElsewhere);
  assert((delivered == std::vector<int>{0, 1, 2, 3, 4}));
}

void TestProcessPending() {
  BackgroundScheduler scheduler;
  int runs = 0;
  assert(scheduler.processPending() == 0);
  scheduler.deliver([&runs]() { runs++; });
  scheduler.deliver([&runs]() { runs++; });
  assert(scheduler.processPending() == 2);
  assert(runs == 2);
}

void TestFailingTaskDoesNotEscape() {
  bool delivered = false;
  BackgroundScheduler scheduler;
  scheduler.runInBackground([]() { throw std::runtime_error{"task failed"}; });
  scheduler.runInBackground([&scheduler, &delivered]() { scheduler.deliver([&delivered]() { delivered = true; }); });
  scheduler.waitUntil([&delivered] { return delivered; });
}

void TestFinishedWorkersAreJoined() {
  int done = 0;
  BackgroundScheduler scheduler;
  for (int i = 0; i < 3; i++) {
    scheduler.runInBackground([&scheduler, &done]() { scheduler.deliver([&done]() { done++; }); });
  }
  assert(scheduler.workerCount() <= 3);
  scheduler.waitUntil([&] { return done == 3 && scheduler.workerCount() == 0; });

  // Workers of later tasks don't accumulate either
  for (int round = 0; round < 10; round++) {
    scheduler.runInBackground([]() {});
    scheduler.waitUntil([&scheduler] { return scheduler.workerCount() == 0; });
  }
  assert(scheduler.processPending() == 0);
}

void TestImmediateScheduler() {
  ImmediateScheduler scheduler;
  std::vector<int> order;
  scheduler.runInBackground([&]() {
    order.push_back(1);
    scheduler.deliver([&order]() { order.push_back(2); });
    order.push_back(3);
  });
  assert((order == std::vector<int>{1, 2, 3}));
}

void TestLockWithinProcess() {
  OperationLock lock;
  assert(!lock.isHeld());
  {
    std::unique_ptr<OperationLease> lease = lock.tryAcquire();
    assert(lease);
    assert(lock.isHeld());
    assert(!lock.tryAcquire());
  }
  assert(!lock.isHeld());
  assert(lock.tryAcquire());
}

void TestLockFile() {
  TemporaryDirectory tmp;
  OperationLock lock{tmp.path() / "rebasekit.lock"};
  auto lease = lock.tryAcquire();
  assert(lease);
  assert(std::filesystem::exists(tmp.path() / "rebasekit.lock"));
  assert(!lock.tryAcquire());
  lease.reset();
  assert(!lock.isHeld());
  assert(lock.tryAcquire());
}

void TestUnusableLockFileFallsBack() {
  OperationLock lock{"/nonexistent-rebasekit-dir/rebasekit.lock"};
  auto lease = lock.tryAcquire();
  assert(lease);
  assert(lock.isHeld());
  assert(!lock.tryAcquire());
}

} // namespace

int main() {
  TestDeliveriesRunInOwnerThread();
  TestProcessPending();
  TestFailingTaskDoesNotEscape();
  TestFinishedWorkersAreJoined();
  TestImmediateScheduler();
  TestLockWithinProcess();
  TestLockFile();
  TestUnusableLockFileFallsBack();

  std::cout << "rebasekit_scheduler: pass\n";
  return 0;
}
