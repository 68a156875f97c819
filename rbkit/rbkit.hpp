/* SPDX-License-Identifier: GPL-2.0-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  rbkit - rebase or roll back an image based system
 */

#ifndef REBASEKIT_RBKIT_H
#define REBASEKIT_RBKIT_H

#include "HistoryLedger.hpp"
#include "RegistryBrowser.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <variant>

struct RebaseRequest {
    std::string imageRef;
};
struct RollbackRequest {
    std::string deploymentId;
};
struct ListDeploymentsRequest {
};
struct HistoryRequest {
    std::size_t limit = RebaseKit::HistoryLedger::MAX_ENTRIES;
    std::optional<RebaseKit::OperationType> type;
    // Only successful (true) or failed (false) entries
    std::optional<bool> success;
};
struct ClearHistoryRequest {
};
struct ReportRequest {
};
struct ExportHistoryRequest {
    std::string file;
};
struct ImagesRequest {
    // Repository of the booted deployment if not given
    std::optional<std::string> repository;
    RebaseKit::ImageBranch branch = RebaseKit::ImageBranch::Stable;
    // No date restriction if not set
    std::optional<int> days = RebaseKit::RegistryBrowser::RECENT_DAYS;
};

using Request = std::variant<RebaseRequest, RollbackRequest, ListDeploymentsRequest, HistoryRequest,
                             ClearHistoryRequest, ReportRequest, ExportHistoryRequest, ImagesRequest>;

class RBKit {
public:
    RBKit(int argc, char *argv[]);
    virtual ~RBKit() = default;

    void displayHelp();
    int parseOptions(int argc, char *argv[]);
    Request parseRequest(char *argv[]);
    int processCommand(char *argv[]);
private:
    int handle(const RebaseRequest& request);
    int handle(const RollbackRequest& request);
    int handle(const ListDeploymentsRequest& request);
    int handle(const HistoryRequest& request);
    int handle(const ClearHistoryRequest& request);
    int handle(const ReportRequest& request);
    int handle(const ExportHistoryRequest& request);
    int handle(const ImagesRequest& request);
    bool assumeYes = false;
};

#endif /* REBASEKIT_RBKIT_H */
