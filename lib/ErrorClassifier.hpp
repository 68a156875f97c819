/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Best effort classification of failed rpm-ostree runs based on the last
  lines of their output. The keyword table is data, not code: every row can
  be replaced via configuration.
 */

#ifndef R_K_ERRORCLASSIFIER_H
#define R_K_ERRORCLASSIFIER_H

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace RebaseKit {

class Configuration;

enum class RuntimeErrorKind {
    None = 0,
    InvalidCommand,
    Network,
    Auth,
    Timeout,
    Busy,
    NotFound,
    Unknown
};

const char* toString(RuntimeErrorKind kind);

/**
 * @brief Remedial action the presentation layer may offer as a retry affordance
 */
struct Remedy {
    std::string action;
    std::string description;
};

class ErrorClassifier {
public:
    // Number of output lines inspected, starting with the most recent one
    static constexpr std::size_t SCAN_LINES = 10;

    /**
     * @brief Classifier using the built-in keyword table
     */
    ErrorClassifier();

    /**
     * @brief Built-in table with rows replaced by ERROR_KEYWORDS_<KIND>[...] configuration keys,
     * e.g. ERROR_KEYWORDS_NETWORK[proxy]=proxy error
     */
    static ErrorClassifier fromConfig(Configuration& configuration);

    /**
     * @brief Replace the keywords of one category; matching is case insensitive
     */
    void setKeywords(RuntimeErrorKind kind, std::vector<std::string> keywords);
    const std::vector<std::string>& getKeywords(RuntimeErrorKind kind) const;

    /**
     * @brief Scan the last SCAN_LINES lines newest first; the first line matching any category wins.
     * Within one line the categories are checked in the order Busy, Auth, Network, NotFound, Timeout.
     * @return Unknown if nothing matches
     */
    RuntimeErrorKind classify(const std::vector<std::string>& output) const;
    RuntimeErrorKind classify(const std::string& line) const;

    static std::optional<Remedy> remedyFor(RuntimeErrorKind kind);

    /**
     * @brief Human readable explanation of a failure, based on the kind and the captured output
     */
    static std::string userMessage(RuntimeErrorKind kind, const std::vector<std::string>& output);
private:
    std::vector<std::pair<RuntimeErrorKind, std::vector<std::string>>> table;
};

} // namespace RebaseKit

#endif // R_K_ERRORCLASSIFIER_H
