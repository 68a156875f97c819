/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Custom exception classes
 */

#ifndef R_K_EXCEPTIONS_H
#define R_K_EXCEPTIONS_H

#include <exception>
#include <string>

namespace RebaseKit {

enum class ValidationError {
    DisallowedProgram,
    UnsupportedSubcommand,
    DangerousCharacter,
    TooLong,
    SuspiciousPattern,
    DisallowedRegistryOrPath
};

enum class StatusError {
    StatusUnavailable,
    NoCurrentDeployment,
    AmbiguousBootedDeployment
};

enum class RegistryError {
    ToolUnavailable,
    RepositoryNotAllowed,
    QueryFailed,
    InvalidResponse
};

const char* toString(ValidationError error);
const char* toString(StatusError error);
const char* toString(RegistryError error);

class ExecutionException : public std::exception
{
public:
    ExecutionException(const std::string& reason, const int returncode, const std::string& output)
        : reason{reason}, returncode{returncode}, output{output} {
    }
    const char* what() const noexcept override {
        return reason.c_str();
    }
    const std::string reason;
    const int returncode;
    const std::string output;
};

/**
 * @brief Thrown by the CommandValidator; the message is safe to show to the user verbatim.
 */
class ValidationException : public std::exception
{
public:
    ValidationException(ValidationError kind, const std::string& reason)
        : kind{kind}, reason{reason} {
    }
    const char* what() const noexcept override {
        return reason.c_str();
    }
    const ValidationError kind;
private:
    const std::string reason;
};

class StatusException : public std::exception
{
public:
    StatusException(StatusError kind, const std::string& reason)
        : kind{kind}, reason{reason} {
    }
    const char* what() const noexcept override {
        return reason.c_str();
    }
    const StatusError kind;
private:
    const std::string reason;
};

class RegistryException : public std::exception
{
public:
    RegistryException(RegistryError kind, const std::string& reason)
        : kind{kind}, reason{reason} {
    }
    const char* what() const noexcept override {
        return reason.c_str();
    }
    const RegistryError kind;
private:
    const std::string reason;
};

} // namespace RebaseKit

#endif // R_K_EXCEPTIONS_H
