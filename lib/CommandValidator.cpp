/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Allow-list and pattern checks for commands and image references
 */

#include "CommandValidator.hpp"
#include "Exceptions.hpp"
#include "Util.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <utility>

namespace RebaseKit {

using namespace std;

namespace {

const array<string, 5> supportedSubcommands = {"cancel", "deploy", "rebase", "rollback", "status"};

// Characters which would change the meaning of an argument if it ever reached a shell
const string dangerousCharacters = string(";|&`$><\n\r") + '\0';

// Never part of a valid image reference
const string suspiciousCharacters = "$`;|&<>(){}[]'\"*?!#~^%\\";

string printable(char c) {
    switch (c) {
    case '\n':
        return "\\n";
    case '\r':
        return "\\r";
    case '\t':
        return "\\t";
    case '\0':
        return "\\0";
    default:
        return string(1, c);
    }
}

bool isQuoted(const string& arg) {
    return arg.size() >= 2 &&
        ((arg.front() == '\'' && arg.back() == '\'') || (arg.front() == '"' && arg.back() == '"'));
}

[[noreturn]] void suspicious(const string& what) {
    throw ValidationException{ValidationError::SuspiciousPattern,
        "Image reference contains a suspicious pattern: " + what + "."};
}

void checkSuspiciousPatterns(const string& ref) {
    for (unsigned char c: ref) {
        if (c < 0x20 || c == 0x7f || c == ' ')
            suspicious("whitespace or control character");
        if (c >= 0x80)
            suspicious("non-ASCII character");
    }
    for (auto& sequence: {"..", "//", "://"}) {
        if (ref.find(sequence) != string::npos)
            suspicious(string("path traversal or protocol sequence '") + sequence + "'");
    }
    size_t pos = ref.find_first_of(suspiciousCharacters);
    if (pos != string::npos)
        suspicious("shell metacharacter or escape '" + printable(ref[pos]) + "'");
    if (ref.front() == '-')
        suspicious("leading '-' (option injection)");
    if (ref.front() == '.' || ref.front() == '/')
        suspicious("leading '" + printable(ref.front()) + "'");

    // A colon in front of the first slash is only acceptable as a registry port number;
    // anything else is a transport or protocol prefix such as "docker:" or "oci:".
    size_t colon = ref.find(':');
    size_t slash = ref.find('/');
    if (colon != string::npos && (slash == string::npos || colon < slash)) {
        string port = ref.substr(colon + 1, slash == string::npos ? string::npos : slash - colon - 1);
        if (port.empty() || !all_of(port.begin(), port.end(), [](unsigned char c) { return isdigit(c); }))
            suspicious("protocol prefix '" + ref.substr(0, colon + 1) + "'");
    }
}

} // namespace

CommandValidator::CommandValidator(RegistryAllowList allowList) : allowList{std::move(allowList)} {
}

void CommandValidator::validate(const Command& command) {
    if (command.empty())
        throw ValidationException{ValidationError::DisallowedProgram, "Empty command"};
    if (command[0] != ALLOWED_PROGRAM)
        throw ValidationException{ValidationError::DisallowedProgram,
            "Program '" + command[0] + "' is not allowed; only " + ALLOWED_PROGRAM + " may be executed."};

    for (auto& arg: command) {
        size_t pos = arg.find_first_of(dangerousCharacters);
        if (pos == string::npos)
            continue;
        if (isQuoted(arg))
            throw ValidationException{ValidationError::DangerousCharacter,
                "Quoted argument " + arg + " contains dangerous character '" + printable(arg[pos]) +
                "'; quoting does not make it safe."};
        throw ValidationException{ValidationError::DangerousCharacter,
            "Argument '" + arg + "' contains dangerous character '" + printable(arg[pos]) + "'."};
    }

    if (command.size() < 2)
        throw ValidationException{ValidationError::UnsupportedSubcommand, "Missing " + ALLOWED_PROGRAM + " subcommand."};
    if (find(supportedSubcommands.begin(), supportedSubcommands.end(), command[1]) == supportedSubcommands.end())
        throw ValidationException{ValidationError::UnsupportedSubcommand,
            "Unsupported " + ALLOWED_PROGRAM + " subcommand '" + command[1] + "'."};
}

void CommandValidator::validateImageReference(const string& ref) const {
    if (ref.size() > MAX_REFERENCE_LENGTH)
        throw ValidationException{ValidationError::TooLong,
            "Image reference is too long (" + to_string(ref.size()) + " characters, maximum is " +
            to_string(MAX_REFERENCE_LENGTH) + ")."};
    if (ref.empty())
        throw ValidationException{ValidationError::DisallowedRegistryOrPath, "Empty image reference is not allowed."};

    checkSuspiciousPatterns(ref);

    size_t slash = ref.find('/');
    if (slash == string::npos)
        throw ValidationException{ValidationError::DisallowedRegistryOrPath,
            "Image reference '" + ref + "' is not allowed: the registry host is missing."};
    string host = ref.substr(0, slash);
    string remainder = ref.substr(slash + 1);

    if (!allowList.hasRegistry(host))
        throw ValidationException{ValidationError::DisallowedRegistryOrPath,
            "Registry '" + host + "' is not allowed; allowed registries: " + Util::join(allowList.registries(), ", ") + "."};

    string path;
    string tag;
    string digest;
    size_t at = remainder.find('@');
    if (at != string::npos) {
        path = remainder.substr(0, at);
        digest = remainder.substr(at + 1);
    } else {
        size_t colon = remainder.rfind(':');
        if (colon != string::npos) {
            path = remainder.substr(0, colon);
            tag = remainder.substr(colon + 1);
        } else {
            path = remainder;
        }
    }

    static const regex pathExp("[a-z0-9]+(?:[._-][a-z0-9]+)*(?:/[a-z0-9]+(?:[._-][a-z0-9]+)*)*");
    if (!regex_match(path, pathExp) || !allowList.isPathAllowed(host, path))
        throw ValidationException{ValidationError::DisallowedRegistryOrPath,
            "Image path '" + path + "' is not allowed for registry " + host + "; permitted paths: " +
            Util::join(allowList.permittedPaths(host), ", ") + "."};

    static const regex tagExp("[A-Za-z0-9_][A-Za-z0-9_.-]{0,127}");
    static const regex digestExp("sha256:[a-f0-9]{64}");
    if (at != string::npos) {
        if (!regex_match(digest, digestExp))
            throw ValidationException{ValidationError::DisallowedRegistryOrPath,
                "Image digest '" + digest + "' is not allowed, expected sha256:<64 hex characters>."};
    } else if (tag.empty()) {
        throw ValidationException{ValidationError::DisallowedRegistryOrPath,
            "Image reference '" + ref + "' is not allowed without a tag, e.g. " + host + "/" + path + ":stable."};
    } else if (!regex_match(tag, tagExp)) {
        throw ValidationException{ValidationError::DisallowedRegistryOrPath, "Image tag '" + tag + "' is not allowed."};
    }

    validate({ALLOWED_PROGRAM, "rebase", ref});
}

std::string toDisplayString(const Command& command) {
    return Util::join(command, " ");
}

} // namespace RebaseKit
