/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Size bounded audit trail of executed operations
 */

#include "HistoryLedger.hpp"
#include "Configuration.hpp"
#include "Log.hpp"
#include "Util.hpp"
#include <cerrno>
#include <cmath>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <fstream>
#include <json/json.h>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace RebaseKit {

namespace fs = std::filesystem;

namespace {

constexpr mode_t LEDGER_MODE = S_IRUSR | S_IWUSR;
// 9999-12-31 23:59:59 UTC
constexpr double MAX_TIMESTAMP = 253402300799.0;

bool isValidTimestamp(double timestamp) {
    return std::isfinite(timestamp) && timestamp >= 0 && timestamp <= MAX_TIMESTAMP;
}

Json::Value toJson(const HistoryEntry& entry) {
    Json::Value value{Json::objectValue};
    value["command"] = entry.command;
    value["timestamp"] = entry.timestamp;
    value["success"] = entry.success;
    value["image_name"] = entry.imageName;
    value["operation_type"] = toString(entry.operationType);
    value["user_id"] = entry.userId ? Json::Value{static_cast<Json::UInt>(*entry.userId)} : Json::Value{};
    value["session_id"] = entry.sessionId.empty() ? Json::Value{} : Json::Value{entry.sessionId};
    value["error_message"] = entry.errorMessage.empty() ? Json::Value{} : Json::Value{entry.errorMessage};
    return value;
}

std::optional<HistoryEntry> fromJson(const Json::Value& value) {
    if (!value.isObject() || !value["command"].isString() || !value["timestamp"].isNumeric() ||
        !value["success"].isBool() || !value["operation_type"].isString())
        return std::nullopt;
    std::optional<OperationType> type = operationTypeFromString(value["operation_type"].asString());
    if (!type)
        return std::nullopt;

    HistoryEntry entry;
    entry.command = value["command"].asString();
    entry.timestamp = value["timestamp"].asDouble();
    if (!isValidTimestamp(entry.timestamp))
        return std::nullopt;
    entry.success = value["success"].asBool();
    entry.operationType = *type;
    if (value["image_name"].isString())
        entry.imageName = value["image_name"].asString();
    if (value["user_id"].isUInt())
        entry.userId = static_cast<uid_t>(value["user_id"].asUInt());
    if (value["session_id"].isString())
        entry.sessionId = value["session_id"].asString();
    if (value["error_message"].isString())
        entry.errorMessage = value["error_message"].asString();
    return entry;
}

std::string serialize(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

// Write to <target>.tmp created with owner-only permissions, then rename over the target
void writeOwnerOnly(const fs::path& target, const std::string& content) {
    fs::path tmp = target;
    tmp += ".tmp";
    int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, LEDGER_MODE);
    if (fd < 0)
        throw std::runtime_error{"Could not create " + tmp.native() + ": " + std::string(strerror(errno))};
    // An existing .tmp file keeps its old mode on open()
    if (fchmod(fd, LEDGER_MODE) < 0) {
        int error = errno;
        close(fd);
        unlink(tmp.c_str());
        throw std::runtime_error{"Could not set permissions of " + tmp.native() + ": " + std::string(strerror(error))};
    }
    size_t written = 0;
    while (written < content.size()) {
        ssize_t ret = write(fd, content.data() + written, content.size() - written);
        if (ret < 0 && errno == EINTR)
            continue;
        if (ret < 0) {
            int error = errno;
            close(fd);
            unlink(tmp.c_str());
            throw std::runtime_error{"Could not write " + tmp.native() + ": " + std::string(strerror(error))};
        }
        written += ret;
    }
    if (fsync(fd) < 0 || close(fd) < 0) {
        int error = errno;
        unlink(tmp.c_str());
        throw std::runtime_error{"Could not write " + tmp.native() + ": " + std::string(strerror(error))};
    }
    if (rename(tmp.c_str(), target.c_str()) < 0) {
        int error = errno;
        unlink(tmp.c_str());
        throw std::runtime_error{"Could not replace " + target.native() + ": " + std::string(strerror(error))};
    }
    if (chmod(target.c_str(), LEDGER_MODE) < 0)
        throw std::runtime_error{"Could not set permissions of " + target.native() + ": " + std::string(strerror(errno))};
}

void logToSyslog(const HistoryEntry& entry) {
    std::stringstream message;
    message << "rebasekit: " << toString(entry.operationType) << " " << (entry.success ? "succeeded" : "failed")
            << " - user=" << (entry.userId ? std::to_string(*entry.userId) : std::string{"unknown"})
            << " session=" << (entry.sessionId.empty() ? std::string{"unknown"} : entry.sessionId)
            << " command=" << entry.command;
    if (!entry.errorMessage.empty())
        message << " error=" << entry.errorMessage;
    if (entry.success)
        syslog(LOG_INFO, "%s", message.str().c_str());
    else
        syslog(LOG_WARNING, "%s", message.str().c_str());
}

std::string sessionId() {
    for (auto& variable: {"XDG_SESSION_ID", "SESSIONID"}) {
        const char* value = getenv(variable);
        if (value != nullptr && *value != '\0')
            return value;
    }
    return {};
}

} // namespace

const char* toString(OperationType type) {
    switch (type) {
    case OperationType::Rebase:
        return "rebase";
    case OperationType::Rollback:
        return "rollback";
    }
    return "unknown";
}

std::optional<OperationType> operationTypeFromString(const std::string& name) {
    if (name == "rebase")
        return OperationType::Rebase;
    if (name == "rollback")
        return OperationType::Rollback;
    return std::nullopt;
}

std::string HistoryEntry::formattedTime() const {
    if (!isValidTimestamp(timestamp))
        return "Unknown";
    time_t seconds = static_cast<time_t>(timestamp);
    struct tm tm;
    char buffer[32];
    if (localtime_r(&seconds, &tm) == nullptr || strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm) == 0)
        return "Unknown";
    return buffer;
}

void HistoryStatistics::count(bool success) {
    total++;
    if (success)
        successful++;
    else
        failed++;
}

std::string SecurityReport::toJson() const {
    auto statistics = [](const HistoryStatistics& s) {
        Json::Value value{Json::objectValue};
        value["total"] = static_cast<Json::UInt64>(s.total);
        value["success"] = static_cast<Json::UInt64>(s.successful);
        value["failed"] = static_cast<Json::UInt64>(s.failed);
        return value;
    };

    Json::Value root{Json::objectValue};
    root["report_generated"] = generated;
    root["summary"]["total_commands"] = static_cast<Json::UInt64>(summary.total);
    root["summary"]["successful"] = static_cast<Json::UInt64>(summary.successful);
    root["summary"]["failed"] = static_cast<Json::UInt64>(summary.failed);
    root["summary"]["success_rate"] = successRate;
    root["user_statistics"] = Json::Value{Json::objectValue};
    for (auto& [user, s]: users) {
        root["user_statistics"][user] = statistics(s);
    }
    root["operation_statistics"] = Json::Value{Json::objectValue};
    for (auto& [operation, s]: operations) {
        root["operation_statistics"][operation] = statistics(s);
    }
    root["recent_failures"] = Json::Value{Json::arrayValue};
    for (auto& entry: recentFailures) {
        Json::Value failure{Json::objectValue};
        failure["timestamp"] = entry.formattedTime();
        failure["command"] = entry.command;
        failure["error"] = entry.errorMessage.empty() ? std::string{"Unknown error"} : entry.errorMessage;
        failure["user"] = entry.userId ? std::to_string(*entry.userId) : std::string{"unknown"};
        root["recent_failures"].append(failure);
    }
    root["history_file"] = historyFile.native();
    return serialize(root);
}

HistoryLedger::HistoryLedger(fs::path file) : file{std::move(file)} {
    rklog.debug("Using history file ", this->file.native());
}

fs::path HistoryLedger::defaultPath() {
    std::string configured = config.get("HISTORY_FILE");
    if (!configured.empty())
        return fs::path(configured);
    return Util::userDataDir() / "rebasekit" / "command_history.json";
}

std::vector<HistoryEntry> HistoryLedger::load() const {
    std::vector<HistoryEntry> entries;
    std::ifstream in{file};
    if (!in.is_open())
        return entries;

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors) || !root.isArray()) {
        rklog.warning("History file ", file.native(), " is corrupted, ignoring its content.");
        return entries;
    }
    for (auto& value: root) {
        std::optional<HistoryEntry> entry = fromJson(value);
        if (entry)
            entries.push_back(*entry);
        else
            rklog.debug("Skipping malformed history entry.");
    }
    return entries;
}

void HistoryLedger::save(const std::vector<HistoryEntry>& entries) const {
    if (file.has_parent_path() && !fs::exists(file.parent_path())) {
        fs::create_directories(file.parent_path());
        fs::permissions(file.parent_path(), fs::perms::owner_all, fs::perm_options::replace);
    }
    Json::Value root{Json::arrayValue};
    for (auto& entry: entries) {
        root.append(toJson(entry));
    }
    writeOwnerOnly(file, serialize(root));
}

void HistoryLedger::addEntry(const std::string& command, bool success, const std::string& imageName,
                             OperationType operationType, const std::string& errorMessage) {
    HistoryEntry entry;
    entry.command = command;
    entry.timestamp = std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
    entry.success = success;
    entry.imageName = imageName;
    entry.operationType = operationType;
    entry.userId = getuid();
    entry.sessionId = sessionId();
    entry.errorMessage = errorMessage;
    logToSyslog(entry);

    std::lock_guard<std::mutex> guard{mutex};
    std::vector<HistoryEntry> entries = load();
    entries.insert(entries.begin(), entry);
    if (entries.size() > MAX_ENTRIES)
        entries.resize(MAX_ENTRIES);
    save(entries);
}

std::vector<HistoryEntry> HistoryLedger::getRecentEntries(size_t limit) const {
    std::lock_guard<std::mutex> guard{mutex};
    std::vector<HistoryEntry> entries = load();
    if (entries.size() > limit)
        entries.resize(limit);
    return entries;
}

std::vector<HistoryEntry> HistoryLedger::query(std::optional<OperationType> operationType,
                                               std::optional<bool> success, size_t limit) const {
    std::vector<HistoryEntry> result;
    for (auto& entry: getRecentEntries()) {
        if (result.size() >= limit)
            break;
        if (operationType && entry.operationType != *operationType)
            continue;
        if (success && entry.success != *success)
            continue;
        result.push_back(entry);
    }
    return result;
}

std::vector<HistoryEntry> HistoryLedger::getEntriesByType(OperationType operationType) const {
    return query(operationType, std::nullopt);
}

std::vector<HistoryEntry> HistoryLedger::getSuccessfulEntries() const {
    return query(std::nullopt, true);
}

std::vector<HistoryEntry> HistoryLedger::getFailedEntries() const {
    return query(std::nullopt, false);
}

SecurityReport HistoryLedger::securityReport() const {
    std::vector<HistoryEntry> entries = getRecentEntries();

    SecurityReport report;
    time_t now = time(nullptr);
    struct tm tm;
    char buffer[32];
    if (localtime_r(&now, &tm) != nullptr && strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm) != 0)
        report.generated = buffer;
    report.historyFile = file;

    for (size_t i = 0; i < entries.size(); i++) {
        const HistoryEntry& entry = entries[i];
        report.summary.count(entry.success);
        report.users[entry.userId ? std::to_string(*entry.userId) : "unknown"].count(entry.success);
        report.operations[toString(entry.operationType)].count(entry.success);
        if (i < 10 && !entry.success)
            report.recentFailures.push_back(entry);
    }

    if (report.summary.total == 0) {
        report.successRate = "N/A";
    } else {
        char rate[16];
        snprintf(rate, sizeof(rate), "%.1f%%", 100.0 * report.summary.successful / report.summary.total);
        report.successRate = rate;
    }
    return report;
}

void HistoryLedger::exportTo(const fs::path& target) const {
    std::vector<HistoryEntry> entries = getRecentEntries();
    Json::Value root{Json::arrayValue};
    for (auto& entry: entries) {
        root.append(toJson(entry));
    }
    writeOwnerOnly(target, serialize(root));
    rklog.info("Exported ", entries.size(), " history entries to ", target.native(), ".");
}

void HistoryLedger::clear() {
    std::lock_guard<std::mutex> guard{mutex};
    save({});
    rklog.info("History cleared.");
}

} // namespace RebaseKit
