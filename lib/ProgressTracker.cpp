/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Progress estimation from rpm-ostree output
 */

#include "ProgressTracker.hpp"
#include "Log.hpp"
#include "Util.hpp"
#include <regex>
#include <utility>

namespace RebaseKit {

namespace {

// Checked in order; the first matching marker determines the stage
const std::pair<const char*, const char*> stages[] = {
    {"Scanning metadata", "Scanning metadata"},
    {"Pulling manifest", "Pulling manifest"},
    {"Fetching ostree chunk", "Fetching chunks"},
    {"Fetching layer", "Fetching layers"},
    {"Importing", "Importing layers"},
    {"Checking out tree", "Checking out files"},
    {"Writing objects", "Writing objects"},
    {"Staging deployment", "Staging deployment"},
    {"Transaction complete", "Finalizing"},
    {"Receiving objects", "Downloading objects"},
    {"Receiving deltas", "Processing deltas"},
    {"Resolving deltas", "Resolving deltas"}
};

} // namespace

std::string ProgressTracker::stripAnsi(const std::string& text) {
    static const std::regex ansiExp(R"(\x1B(?:[@-Z\\-_]|\[[0-?]*[ -/]*[@-~]))");
    return std::regex_replace(text, ansiExp, "");
}

ProgressUpdate ProgressTracker::parseLine(const std::string& text) {
    static const std::regex chunkExp(R"(\[(\d{1,9})/(\d{1,9})\]\s*Fetching (?:ostree chunk|layer))");
    static const std::regex counterExp(R"((\d{1,3})%\s*\((\d+)/(\d+)\))");

    ProgressUpdate update;
    std::smatch match;
    if (std::regex_search(text, match, chunkExp)) {
        long current = std::stol(match[1].str());
        long total = std::stol(match[2].str());
        if (total > 0 && current <= total)
            update.percent = static_cast<int>(current * 100 / total);
    } else if (std::regex_search(text, match, counterExp)) {
        int value = std::stoi(match[1].str());
        if (value <= 100)
            update.percent = value;
    }

    for (auto& [marker, name]: stages) {
        if (text.find(marker) != std::string::npos) {
            update.stage = name;
            break;
        }
    }
    if (text.find("Transaction complete") != std::string::npos ||
        (text.find("Checking out tree") != std::string::npos && text.find("done") != std::string::npos))
        update.percent = 100;
    return update;
}

void ProgressTracker::started(const std::string& operation) {
    this->operation = operation;
    partial.clear();
    output.clear();
    percent.reset();
    stage.clear();
    startTime = std::chrono::steady_clock::now();
    tracking = true;
    rklog.debug("Tracking progress of ", operation);
}

void ProgressTracker::line(const std::string& text) {
    if (!tracking)
        return;
    // Terminal progress bars redraw the line after a carriage return; keep the last state
    std::string current = text;
    size_t cr;
    while (!current.empty() && (cr = current.rfind('\r')) != std::string::npos) {
        if (cr + 1 < current.size()) {
            current.erase(0, cr + 1);
            break;
        }
        current.erase(cr);
    }
    std::string clean = stripAnsi(current);
    std::string trimmed = clean;
    Util::trim(trimmed);
    if (trimmed.empty())
        return;

    output.push_back(clean);
    if (output.size() > MAX_LINES)
        output.pop_front();

    ProgressUpdate update = parseLine(clean);
    if (update.percent)
        percent = update.percent;
    if (!update.stage.empty())
        stage = update.stage;
}

void ProgressTracker::feed(const std::string& data) {
    partial.append(data);
    size_t newline;
    while ((newline = partial.find('\n')) != std::string::npos) {
        std::string complete = partial.substr(0, newline);
        partial.erase(0, newline + 1);
        line(complete);
    }
}

void ProgressTracker::finished(bool success, const std::string& message) {
    if (!tracking)
        return;
    if (!partial.empty()) {
        std::string rest = std::move(partial);
        partial.clear();
        line(rest);
    }
    if (success)
        percent = 100;
    tracking = false;
    rklog.debug(operation, (success ? " finished: " : " failed: "), message, " (", output.size(),
                " lines, ", getElapsed().count(), "s)");
}

std::string ProgressTracker::getFullOutput() const {
    std::string result;
    for (auto& l: output) {
        if (!result.empty())
            result.append("\n");
        result.append(l);
    }
    return result;
}

std::chrono::seconds ProgressTracker::getElapsed() const {
    if (startTime == std::chrono::steady_clock::time_point{})
        return std::chrono::seconds{0};
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime);
}

} // namespace RebaseKit
