/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Deployments as reported by `rpm-ostree status --json`, and the commands
  to go back to one of them.
 */

#ifndef R_K_DEPLOYMENT_H
#define R_K_DEPLOYMENT_H

#include "Command.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace RebaseKit {

class ProcessSpawner;

struct Deployment {
    // First 12 characters of the checksum
    std::string id;
    std::string checksum;
    std::string origin;
    std::string version;
    std::string timestamp;
    bool isBooted = false;
    bool isPinned = false;
    // Position in the status listing, 0 being the most recent deployment
    std::size_t index = 0;
};

struct DeploymentInfo {
    std::string title;
    std::string imageName;
    std::string version;
    std::string timestamp;
    std::string shortId;
    std::vector<std::string> badges;
};

constexpr std::size_t DEPLOYMENT_ID_LENGTH = 12;
constexpr std::size_t MIN_CHECKSUM_PREFIX = 8;

/**
 * @brief Parse the JSON output of `rpm-ostree status --json`
 *
 * Throws a StatusException: StatusUnavailable if the document can't be parsed or has no
 * "deployments" array, NoCurrentDeployment / AmbiguousBootedDeployment unless exactly one
 * deployment is booted.
 */
std::vector<Deployment> parseStatus(const std::string& json);

/**
 * @brief Find a deployment by id or by a checksum prefix of at least MIN_CHECKSUM_PREFIX characters
 * @return nullptr if there is no match or the prefix is ambiguous
 */
const Deployment* findDeployment(const std::string& targetId, const std::vector<Deployment>& deployments);
const Deployment* bootedDeployment(const std::vector<Deployment>& deployments);

/**
 * @brief Command making the given deployment the default one for the next boot
 * @return nothing if the target is the booted deployment or unknown
 *
 * The deployment following the booted one is addressed with `rpm-ostree rollback`, all
 * others with `rpm-ostree deploy <checksum>`.
 */
std::optional<Command> generateRollbackCommand(const std::string& targetId, const std::vector<Deployment>& deployments);

/**
 * @brief User friendly image name, e.g. "Bluefin DX" for ghcr.io/ublue-os/bluefin-dx:stable
 */
std::string friendlyImageName(const std::string& origin);

DeploymentInfo describeDeployment(const Deployment& deployment);
std::string formatDeploymentInfo(const Deployment& deployment);

class StatusReader {
public:
    explicit StatusReader(ProcessSpawner& spawner);
    virtual ~StatusReader() = default;

    /**
     * @brief Query and parse the current deployments
     *
     * A missing rpm-ostree binary or failing status command is reported as
     * StatusException{StatusUnavailable}.
     */
    virtual std::vector<Deployment> read();
private:
    ProcessSpawner& spawner;
};

} // namespace RebaseKit

#endif // R_K_DEPLOYMENT_H
