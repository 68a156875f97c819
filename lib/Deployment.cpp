/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Deployments as reported by `rpm-ostree status --json`
 */

#include "Deployment.hpp"
#include "Exceptions.hpp"
#include "Log.hpp"
#include "ProcessSpawner.hpp"
#include "Util.hpp"
#include <cctype>
#include <ctime>
#include <json/json.h>
#include <sstream>

namespace RebaseKit {

namespace {

std::string stringMember(const Json::Value& entry, const char* key) {
    const Json::Value& value = entry[key];
    if (value.isString())
        return value.asString();
    return {};
}

std::string formatTimestamp(const Json::Value& value) {
    if (value.isString())
        return value.asString();
    if (!value.isInt64())
        return "Unknown";
    time_t seconds = static_cast<time_t>(value.asLargestInt());
    struct tm tm;
    if (gmtime_r(&seconds, &tm) == nullptr)
        return "Unknown";
    char buffer[32];
    if (strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm) == 0)
        return "Unknown";
    return buffer;
}

// "base-main" -> "Base-Main"
std::string titleCase(std::string s) {
    bool startOfWord = true;
    for (auto& c: s) {
        unsigned char uc = static_cast<unsigned char>(c);
        c = startOfWord ? std::toupper(uc) : std::tolower(uc);
        startOfWord = !std::isalpha(uc);
    }
    return s;
}

// Last path element without tag or digest
std::string imageBaseName(const std::string& origin) {
    std::string name = origin.substr(origin.rfind('/') + 1);
    size_t end = name.find_first_of(":@");
    if (end != std::string::npos)
        name.erase(end);
    return name;
}

} // namespace

namespace {

std::vector<Deployment> parseDeployments(const std::string& json) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream in{json};
    if (!Json::parseFromStream(builder, in, &root, &errors))
        throw StatusException{StatusError::StatusUnavailable, "Could not parse deployment status: " + errors};
    if (!root.isObject() || !root["deployments"].isArray())
        throw StatusException{StatusError::StatusUnavailable, "Deployment status doesn't contain a deployment list."};

    std::vector<Deployment> deployments;
    size_t booted = 0;
    const Json::Value& list = root["deployments"];
    for (Json::ArrayIndex i = 0; i < list.size(); i++) {
        const Json::Value& entry = list[i];
        if (!entry.isObject())
            throw StatusException{StatusError::StatusUnavailable, "Invalid deployment entry " + std::to_string(i) + "."};

        Deployment d;
        d.checksum = stringMember(entry, "checksum");
        if (d.checksum.empty())
            throw StatusException{StatusError::StatusUnavailable, "Deployment " + std::to_string(i) + " has no checksum."};
        d.id = d.checksum.substr(0, DEPLOYMENT_ID_LENGTH);
        d.origin = stringMember(entry, "origin");
        if (d.origin.empty())
            d.origin = stringMember(entry, "container-image-reference");
        if (d.origin.empty())
            d.origin = "Unknown";
        d.version = stringMember(entry, "version");
        if (d.version.empty())
            d.version = "Unknown";
        d.timestamp = formatTimestamp(entry["timestamp"]);
        d.isBooted = entry["booted"].isBool() && entry["booted"].asBool();
        d.isPinned = entry["pinned"].isBool() && entry["pinned"].asBool();
        d.index = i;
        if (d.isBooted)
            booted++;
        deployments.push_back(d);
    }

    if (booted == 0)
        throw StatusException{StatusError::NoCurrentDeployment, "None of the deployments is marked as booted."};
    if (booted > 1)
        throw StatusException{StatusError::AmbiguousBootedDeployment,
            std::to_string(booted) + " deployments are marked as booted."};
    rklog.debug("Found ", deployments.size(), " deployment(s).");
    return deployments;
}

} // namespace

std::vector<Deployment> parseStatus(const std::string& json) {
    try {
        return parseDeployments(json);
    } catch (const Json::Exception &e) {
        throw StatusException{StatusError::StatusUnavailable, std::string{"Invalid deployment status: "} + e.what()};
    }
}

const Deployment* findDeployment(const std::string& targetId, const std::vector<Deployment>& deployments) {
    for (auto& d: deployments) {
        if (d.id == targetId || d.checksum == targetId)
            return &d;
    }
    if (targetId.size() < MIN_CHECKSUM_PREFIX)
        return nullptr;
    const Deployment* match = nullptr;
    for (auto& d: deployments) {
        if (Util::startsWith(d.checksum, targetId)) {
            if (match != nullptr && match->checksum != d.checksum) {
                rklog.info("Deployment id '", targetId, "' is ambiguous.");
                return nullptr;
            }
            match = &d;
        }
    }
    return match;
}

const Deployment* bootedDeployment(const std::vector<Deployment>& deployments) {
    for (auto& d: deployments) {
        if (d.isBooted)
            return &d;
    }
    return nullptr;
}

std::optional<Command> generateRollbackCommand(const std::string& targetId, const std::vector<Deployment>& deployments) {
    const Deployment* target = findDeployment(targetId, deployments);
    if (target == nullptr || target->isBooted)
        return std::nullopt;
    const Deployment* booted = bootedDeployment(deployments);
    if (booted != nullptr && target->index == booted->index + 1)
        return Command{ALLOWED_PROGRAM, "rollback"};
    return Command{ALLOWED_PROGRAM, "deploy", target->checksum};
}

std::string friendlyImageName(const std::string& origin) {
    std::string name = imageBaseName(origin);
    if (origin.find("ghcr.io/ublue-os/") != std::string::npos) {
        for (auto& suffix: {"-nvidia", "-dx", "-deck", "-gnome", "-asus"}) {
            std::string variant{suffix};
            if (name.size() > variant.size() && Util::endsWith(name, variant)) {
                std::string base = name.substr(0, name.size() - variant.size());
                std::string label = variant.substr(1);
                for (auto& c: label) {
                    c = std::toupper(static_cast<unsigned char>(c));
                }
                return titleCase(base) + " " + label;
            }
        }
        return titleCase(name);
    }
    if (origin.find("quay.io/fedora") != std::string::npos) {
        if (Util::startsWith(name, "fedora-"))
            name.erase(0, 7);
        for (auto& c: name) {
            if (c == '-')
                c = ' ';
        }
        return "Fedora " + titleCase(name);
    }
    return name.empty() ? origin : name;
}

DeploymentInfo describeDeployment(const Deployment& deployment) {
    DeploymentInfo info;
    info.title = "Deployment " + std::to_string(deployment.index);
    info.imageName = friendlyImageName(deployment.origin);
    info.version = deployment.version;
    info.timestamp = deployment.timestamp;
    info.shortId = deployment.id;
    if (deployment.isBooted)
        info.badges.push_back("Booted");
    if (deployment.isPinned)
        info.badges.push_back("Pinned");
    // A non-booted deployment at the top of the list becomes active with the next reboot
    if (!deployment.isBooted && deployment.index == 0)
        info.badges.push_back("Pending");
    return info;
}

std::string formatDeploymentInfo(const Deployment& deployment) {
    DeploymentInfo info = describeDeployment(deployment);
    std::stringstream ss;
    ss << info.title;
    for (auto& badge: info.badges) {
        ss << " [" << badge << "]";
    }
    ss << std::endl;
    ss << "  Image:    " << info.imageName << " (" << deployment.origin << ")" << std::endl;
    ss << "  Version:  " << info.version << std::endl;
    ss << "  Deployed: " << info.timestamp << std::endl;
    ss << "  ID:       " << info.shortId;
    return ss.str();
}

StatusReader::StatusReader(ProcessSpawner& spawner) : spawner{spawner} {
}

std::vector<Deployment> StatusReader::read() {
    std::vector<std::string> output;
    int ret;
    try {
        ret = spawner.spawn({ALLOWED_PROGRAM, "status", "--json"},
                            [&output](const std::string& line) { output.push_back(line); });
    } catch (const ExecutionException &e) {
        throw StatusException{StatusError::StatusUnavailable, std::string("Deployment status unavailable: ") + e.what()};
    }
    if (ret != 0) {
        std::string reason = output.empty() ? std::string{} : ": " + output.back();
        throw StatusException{StatusError::StatusUnavailable,
            "Deployment status unavailable, " + ALLOWED_PROGRAM + " returned with exit status " +
            std::to_string(ret) + reason};
    }
    return parseStatus(Util::join(output, "\n"));
}

} // namespace RebaseKit
