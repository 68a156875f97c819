/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Helper class
 */

#include "Util.hpp"
#include "Exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <csignal>
#include <pwd.h>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace RebaseKit {

using namespace std;

namespace {
volatile sig_atomic_t pendingSignal = 0;
}

// Only async-signal-safe operations here
void PendingSignal::record(int signal) {
    pendingSignal = signal;
}

int PendingSignal::take() {
    int signal = pendingSignal;
    pendingSignal = 0;
    return signal;
}

const char* toString(ValidationError error) {
    switch (error) {
    case ValidationError::DisallowedProgram:
        return "DisallowedProgram";
    case ValidationError::UnsupportedSubcommand:
        return "UnsupportedSubcommand";
    case ValidationError::DangerousCharacter:
        return "DangerousCharacter";
    case ValidationError::TooLong:
        return "TooLong";
    case ValidationError::SuspiciousPattern:
        return "SuspiciousPattern";
    case ValidationError::DisallowedRegistryOrPath:
        return "DisallowedRegistryOrPath";
    }
    return "Unknown";
}

const char* toString(StatusError error) {
    switch (error) {
    case StatusError::StatusUnavailable:
        return "StatusUnavailable";
    case StatusError::NoCurrentDeployment:
        return "NoCurrentDeployment";
    case StatusError::AmbiguousBootedDeployment:
        return "AmbiguousBootedDeployment";
    }
    return "Unknown";
}

const char* toString(RegistryError error) {
    switch (error) {
    case RegistryError::ToolUnavailable:
        return "ToolUnavailable";
    case RegistryError::RepositoryNotAllowed:
        return "RepositoryNotAllowed";
    case RegistryError::QueryFailed:
        return "QueryFailed";
    case RegistryError::InvalidResponse:
        return "InvalidResponse";
    }
    return "Unknown";
}

// trim from start (in place)
void Util::ltrim(string &s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(),
            [](unsigned char a) { return !std::isspace(a); }));
}

// trim from end (in place)
void Util::rtrim(string &s) {
    s.erase(std::find_if(s.rbegin(), s.rend(),
            [](unsigned char a) { return !std::isspace(a); }).base(), s.end());
}

// trim from both ends (in place)
void Util::trim(string &s) {
    ltrim(s);
    rtrim(s);
}

string Util::toLower(string s) {
    std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return std::tolower(c); });
    return s;
}

string Util::join(const vector<string> &parts, const string &separator) {
    string result;
    for (auto it = parts.begin(); it != parts.end(); ++it) {
        if (it != parts.begin())
            result.append(separator);
        result.append(*it);
    }
    return result;
}

vector<string> Util::split(const string &s, char delimiter) {
    vector<string> fields;
    stringstream ss(s);
    for (string field; getline(ss, field, delimiter); ) {
        fields.push_back(field);
    }
    return fields;
}

bool Util::startsWith(const string &s, const string &prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool Util::endsWith(const string &s, const string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// $XDG_DATA_HOME, falling back to ~/.local/share as described by the XDG base directory spec
filesystem::path Util::userDataDir() {
    const char* xdgDataHome = getenv("XDG_DATA_HOME");
    if (xdgDataHome != nullptr && *xdgDataHome == '/')
        return filesystem::path(xdgDataHome);

    const char* home = getenv("HOME");
    if (home == nullptr || *home == '\0') {
        struct passwd* pw = getpwuid(getuid());
        if (pw == nullptr || pw->pw_dir == nullptr)
            throw runtime_error{"Could not determine the home directory of the current user."};
        home = pw->pw_dir;
    }
    return filesystem::path(home) / ".local" / "share";
}

} // namespace RebaseKit
