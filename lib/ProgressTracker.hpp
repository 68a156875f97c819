/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Receivers of operation output. The ProgressTracker keeps the recent output
  and estimates the progress of an image pull from rpm-ostree's messages.
 */

#ifndef R_K_PROGRESSTRACKER_H
#define R_K_PROGRESSTRACKER_H

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>

namespace RebaseKit {

class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void started(const std::string& operation) = 0;
    // Called once per output line, in the order the process wrote them
    virtual void line(const std::string& text) = 0;
    // Called after the last line
    virtual void finished(bool success, const std::string& message) = 0;
};

struct ProgressUpdate {
    std::optional<int> percent;
    std::string stage;
};

class ProgressTracker : public ProgressSink {
public:
    static constexpr std::size_t MAX_LINES = 1000;

    void started(const std::string& operation) override;
    void line(const std::string& text) override;
    void finished(bool success, const std::string& message) override;

    /**
     * @brief Add raw output which may end in the middle of a line; incomplete lines are kept
     * until the rest arrives or the operation finishes.
     */
    void feed(const std::string& data);

    bool isTracking() const { return tracking; }
    const std::string& getOperation() const { return operation; }
    std::optional<int> getPercent() const { return percent; }
    const std::string& getStage() const { return stage; }
    const std::deque<std::string>& getOutput() const { return output; }
    std::string getFullOutput() const;
    std::chrono::seconds getElapsed() const;

    static std::string stripAnsi(const std::string& text);

    /**
     * @brief Extract progress information from a single line
     *
     * Recognizes "[3/48] Fetching ostree chunk ..." and "95% (190/200)" style counters
     * as well as the names of rpm-ostree's stages.
     */
    static ProgressUpdate parseLine(const std::string& text);
private:
    std::string operation;
    std::string partial;
    std::deque<std::string> output;
    std::optional<int> percent;
    std::string stage;
    std::chrono::steady_clock::time_point startTime;
    bool tracking = false;
};

} // namespace RebaseKit

#endif // R_K_PROGRESSTRACKER_H
