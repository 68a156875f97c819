/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Best effort classification of failed rpm-ostree runs
 */

#include "ErrorClassifier.hpp"
#include "Configuration.hpp"
#include "Log.hpp"
#include "Util.hpp"
#include <algorithm>
#include <stdexcept>

namespace RebaseKit {

using namespace std;

const char* toString(RuntimeErrorKind kind) {
    switch (kind) {
    case RuntimeErrorKind::None:
        return "None";
    case RuntimeErrorKind::InvalidCommand:
        return "InvalidCommand";
    case RuntimeErrorKind::Network:
        return "Network";
    case RuntimeErrorKind::Auth:
        return "Auth";
    case RuntimeErrorKind::Timeout:
        return "Timeout";
    case RuntimeErrorKind::Busy:
        return "Busy";
    case RuntimeErrorKind::NotFound:
        return "NotFound";
    case RuntimeErrorKind::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

ErrorClassifier::ErrorClassifier() {
    // Row order is the match precedence within a single line
    table = {
        {RuntimeErrorKind::Busy, {
            "transaction already in use", "another transaction", "is busy", "transaction in progress"}},
        {RuntimeErrorKind::Auth, {
            "permission denied", "authentication", "authorization failed", "not authorized",
            "unauthorized", "access denied", "polkit"}},
        {RuntimeErrorKind::Network, {
            "unable to connect", "could not resolve", "no such host", "network", "connection refused",
            "connection reset", "dial tcp", "tls handshake", "temporary failure in name resolution"}},
        {RuntimeErrorKind::NotFound, {
            "not found", "no such deployment", "no such image", "manifest unknown", "failed to resolve ref"}},
        {RuntimeErrorKind::Timeout, {
            "timed out", "timeout", "deadline exceeded"}}
    };
}

ErrorClassifier ErrorClassifier::fromConfig(Configuration& configuration) {
    ErrorClassifier classifier;
    const pair<RuntimeErrorKind, const char*> keys[] = {
        {RuntimeErrorKind::Busy, "ERROR_KEYWORDS_BUSY"},
        {RuntimeErrorKind::Auth, "ERROR_KEYWORDS_AUTH"},
        {RuntimeErrorKind::Network, "ERROR_KEYWORDS_NETWORK"},
        {RuntimeErrorKind::NotFound, "ERROR_KEYWORDS_NOTFOUND"},
        {RuntimeErrorKind::Timeout, "ERROR_KEYWORDS_TIMEOUT"}
    };
    for (auto& [kind, key]: keys) {
        vector<string> keywords = configuration.getArray(key);
        if (!keywords.empty()) {
            rklog.debug("Using configured keywords for ", toString(kind), ": ", Util::join(keywords, ", "));
            classifier.setKeywords(kind, keywords);
        }
    }
    return classifier;
}

void ErrorClassifier::setKeywords(RuntimeErrorKind kind, vector<string> keywords) {
    for (auto& keyword: keywords) {
        keyword = Util::toLower(keyword);
    }
    keywords.erase(remove_if(keywords.begin(), keywords.end(),
                   [](const string& k) { return k.empty(); }), keywords.end());
    for (auto& row: table) {
        if (row.first == kind) {
            row.second = std::move(keywords);
            return;
        }
    }
    throw invalid_argument{string("No keyword table for error kind ") + toString(kind) + "."};
}

const vector<string>& ErrorClassifier::getKeywords(RuntimeErrorKind kind) const {
    for (auto& row: table) {
        if (row.first == kind)
            return row.second;
    }
    throw invalid_argument{string("No keyword table for error kind ") + toString(kind) + "."};
}

RuntimeErrorKind ErrorClassifier::classify(const string& line) const {
    string lower = Util::toLower(line);
    for (auto& [kind, keywords]: table) {
        for (auto& keyword: keywords) {
            if (lower.find(keyword) != string::npos)
                return kind;
        }
    }
    return RuntimeErrorKind::Unknown;
}

RuntimeErrorKind ErrorClassifier::classify(const vector<string>& output) const {
    size_t scanned = 0;
    for (auto line = output.rbegin(); line != output.rend() && scanned < SCAN_LINES; ++line, ++scanned) {
        RuntimeErrorKind kind = classify(*line);
        if (kind != RuntimeErrorKind::Unknown)
            return kind;
    }
    return RuntimeErrorKind::Unknown;
}

optional<Remedy> ErrorClassifier::remedyFor(RuntimeErrorKind kind) {
    switch (kind) {
    case RuntimeErrorKind::Auth:
        return Remedy{"reauthenticate",
            "Authenticate again as an administrator and retry the operation."};
    case RuntimeErrorKind::Busy:
        return Remedy{"check-transaction",
            "Another rpm-ostree transaction is in progress; wait for it to finish (see 'rpm-ostree status') "
            "or cancel it with 'rpm-ostree cancel', then retry."};
    default:
        return nullopt;
    }
}

string ErrorClassifier::userMessage(RuntimeErrorKind kind, const vector<string>& output) {
    switch (kind) {
    case RuntimeErrorKind::None:
        return "The operation completed successfully.";
    case RuntimeErrorKind::Network:
        return "Network error: please check your internet connection and try again.";
    case RuntimeErrorKind::Auth:
        return "Authentication failed: you may not have the permissions required for this operation.";
    case RuntimeErrorKind::Busy:
        return "Another system update is already in progress.";
    case RuntimeErrorKind::Timeout:
        return "The operation timed out.";
    default:
        break;
    }

    for (auto it = output.rbegin(); it != output.rend(); ++it) {
        string line = *it;
        Util::trim(line);
        if (Util::startsWith(Util::toLower(line), "error:")) {
            line.erase(0, 6);
            Util::trim(line);
            return "Error: " + line;
        }
    }
    if (kind == RuntimeErrorKind::NotFound)
        return "The requested image or deployment could not be found.";
    if (kind == RuntimeErrorKind::InvalidCommand && !output.empty())
        return output.front();
    return "The operation failed for an unknown reason.";
}

} // namespace RebaseKit
