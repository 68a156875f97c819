/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Size bounded audit trail of executed operations, stored as JSON array in
  a file only readable by its owner. Newest entries come first.
 */

#ifndef R_K_HISTORYLEDGER_H
#define R_K_HISTORYLEDGER_H

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace RebaseKit {

enum class OperationType {
    Rebase, Rollback
};

const char* toString(OperationType type);
std::optional<OperationType> operationTypeFromString(const std::string& name);

struct HistoryEntry {
    std::string command;
    // Seconds since epoch
    double timestamp = 0;
    bool success = false;
    std::string imageName;
    OperationType operationType = OperationType::Rebase;
    std::optional<uid_t> userId;
    std::string sessionId;
    std::string errorMessage;

    std::string formattedTime() const;
};

struct HistoryStatistics {
    std::size_t total = 0;
    std::size_t successful = 0;
    std::size_t failed = 0;
    void count(bool success);
};

struct SecurityReport {
    std::string generated;
    HistoryStatistics summary;
    // "N/A" if there are no entries
    std::string successRate;
    std::map<std::string, HistoryStatistics> users;
    std::map<std::string, HistoryStatistics> operations;
    // Failures among the last ten entries
    std::vector<HistoryEntry> recentFailures;
    std::filesystem::path historyFile;

    std::string toJson() const;
};

class HistoryLedger {
public:
    static constexpr std::size_t MAX_ENTRIES = 50;

    explicit HistoryLedger(std::filesystem::path file = defaultPath());
    virtual ~HistoryLedger() = default;

    /**
     * @brief HISTORY_FILE if configured, $XDG_DATA_HOME/rebasekit/command_history.json otherwise
     */
    static std::filesystem::path defaultPath();

    /**
     * @brief Prepend a new entry, dropping the oldest ones beyond MAX_ENTRIES
     *
     * User and session id are recorded from the calling process; the entry is also written
     * to syslog. Throws a std::runtime_error if the ledger file can't be written.
     */
    void addEntry(const std::string& command, bool success, const std::string& imageName,
                  OperationType operationType, const std::string& errorMessage = {});

    std::vector<HistoryEntry> getRecentEntries(std::size_t limit = MAX_ENTRIES) const;

    /**
     * @brief The newest entries matching all given criteria, at most limit of them
     */
    std::vector<HistoryEntry> query(std::optional<OperationType> operationType, std::optional<bool> success,
                                    std::size_t limit = MAX_ENTRIES) const;
    std::vector<HistoryEntry> getEntriesByType(OperationType operationType) const;
    std::vector<HistoryEntry> getSuccessfulEntries() const;
    std::vector<HistoryEntry> getFailedEntries() const;
    SecurityReport securityReport() const;

    /**
     * @brief Write a copy of the ledger to the given file, also with owner-only permissions
     */
    void exportTo(const std::filesystem::path& target) const;
    void clear();

    const std::filesystem::path& getPath() const { return file; }
private:
    std::vector<HistoryEntry> load() const;
    void save(const std::vector<HistoryEntry>& entries) const;
    std::filesystem::path file;
    mutable std::mutex mutex;
};

} // namespace RebaseKit

#endif // R_K_HISTORYLEDGER_H
