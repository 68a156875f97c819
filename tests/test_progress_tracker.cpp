/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

#include "ProgressTracker.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using RebaseKit::ProgressTracker;
using RebaseKit::ProgressUpdate;

void TestParseChunkCounter() {
  ProgressUpdate update = ProgressTracker::parseLine("[12/48] Fetching ostree chunk 9a8b7c (45.2 MB)");
  assert(update.percent && *update.percent == 25);
  assert(update.stage == "Fetching chunks");

  update = ProgressTracker::parseLine("[3/4] Fetching layer 1f2e3d");
  assert(update.percent && *update.percent == 75);
  assert(update.stage == "Fetching layers");
}

void TestParsePercentCounter() {
  ProgressUpdate update = ProgressTracker::parseLine("Receiving objects: 95% (190/200) 12.3 MB/s");
  assert(update.percent && *update.percent == 95);
  assert(update.stage == "Downloading objects");

  assert(!ProgressTracker::parseLine("Receiving objects: 250% (1/2)").percent);
}

void TestParseStages() {
  assert(ProgressTracker::parseLine("Pulling manifest: ostree-unverified-registry:ghcr.io/ublue-os/bluefin:stable")
             .stage == "Pulling manifest");
  assert(ProgressTracker::parseLine("Staging deployment... done").stage == "Staging deployment");
  assert(ProgressTracker::parseLine("Scanning metadata: 1234").stage == "Scanning metadata");

  ProgressUpdate done = ProgressTracker::parseLine("Checking out tree 1a2b3c... done");
  assert(done.stage == "Checking out files");
  assert(done.percent && *done.percent == 100);

  ProgressUpdate complete = ProgressTracker::parseLine("Transaction complete; bootconfig swap: yes");
  assert(complete.stage == "Finalizing");
  assert(complete.percent && *complete.percent == 100);

  ProgressUpdate nothing = ProgressTracker::parseLine("Run \"systemctl reboot\" to start a reboot");
  assert(!nothing.percent);
  assert(nothing.stage.empty());
}

void TestStripAnsi() {
  assert(ProgressTracker::stripAnsi("\x1b[1mBold\x1b[0m text") == "Bold text");
  assert(ProgressTracker::stripAnsi("\x1b[2K\x1b[1Gprogress") == "progress");
  assert(ProgressTracker::stripAnsi("plain") == "plain");
}

void TestTracking() {
  ProgressTracker tracker;
  tracker.line("ignored before start");
  assert(tracker.getOutput().empty());

  tracker.started("Rebase to Bluefin");
  assert(tracker.isTracking());
  assert(tracker.getOperation() == "Rebase to Bluefin");
  assert(!tracker.getPercent());

  tracker.line("Pulling manifest");
  tracker.line("   ");
  tracker.line("[1/10] Fetching ostree chunk aaaa\r[5/10] Fetching ostree chunk bbbb");
  assert(tracker.getStage() == "Fetching chunks");
  assert(tracker.getPercent() && *tracker.getPercent() == 50);
  assert(tracker.getOutput().size() == 2);
  assert(tracker.getOutput().back() == "[5/10] Fetching ostree chunk bbbb");

  tracker.finished(true, "done");
  assert(!tracker.isTracking());
  assert(*tracker.getPercent() == 100);
  assert(tracker.getFullOutput() == "Pulling manifest\n[5/10] Fetching ostree chunk bbbb");
}

void TestFeedPartialLines() {
  ProgressTracker tracker;
  tracker.started("Rollback");
  tracker.feed("Staging deploy");
  assert(tracker.getOutput().empty());
  tracker.feed("ment... done\nRun \"systemctl");
  assert(tracker.getOutput().size() == 1);
  assert(tracker.getStage() == "Staging deployment");

  tracker.finished(false, "failed");
  assert(tracker.getOutput().size() == 2);
  assert(tracker.getOutput().back() == "Run \"systemctl");
}

void TestOutputIsBounded() {
  ProgressTracker tracker;
  tracker.started("Rebase");
  for (std::size_t i = 0; i < ProgressTracker::MAX_LINES + 10; i++) {
    tracker.line("line " + std::to_string(i));
  }
  assert(tracker.getOutput().size() == ProgressTracker::MAX_LINES);
  assert(tracker.getOutput().front() == "line 10");
}

} // namespace

int main() {
  TestParseChunkCounter();
  TestParsePercentCounter();
  TestParseStages();
  TestStripAnsi();
  TestTracking();
  TestFeedPartialLines();
  TestOutputIsBounded();

  std::cout << "rebasekit_progress_tracker: pass\n";
  return 0;
}
