/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Read-only queries for the images available in a container registry,
  answered by skopeo(1). Only repositories of the registry allow-list are
  ever queried.
 */

#ifndef R_K_REGISTRYBROWSER_H
#define R_K_REGISTRYBROWSER_H

#include "RegistryAllowList.hpp"
#include <cstddef>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace RebaseKit {

class ProcessSpawner;

enum class ImageBranch {
    Stable, Testing, All
};

const char* toString(ImageBranch branch);
std::optional<ImageBranch> imageBranchFromString(const std::string& name);

struct RegistryImage {
    // "ghcr.io/ublue-os/bluefin"
    std::string repository;
    std::string tag;
    // Build date encoded in the tag as YYYYMMDD, midnight UTC
    std::optional<time_t> date;

    std::string reference() const;
    std::string formattedDate() const;
    // Full days between the build date and now, if the tag carries a date
    std::optional<long> ageDays(time_t now = time(nullptr)) const;
};

class RegistryBrowser {
public:
    static constexpr const char* PROGRAM = "skopeo";
    static constexpr int RECENT_DAYS = 90;
    // Undated tags included in getRecentImages() as long as there are fewer results
    static constexpr std::size_t MAX_UNDATED = 20;

    RegistryBrowser(ProcessSpawner& spawner, RegistryAllowList allowList);

    /**
     * @brief Whether skopeo can be run at all
     */
    bool isAvailable();

    /**
     * @brief Tags of a repository on the given branch, newest first; undated tags come last
     * @param repository "<registry>/<path>" without tag, permitted by the allow-list
     *
     * Throws a RegistryException if the repository isn't permitted, skopeo is missing or
     * fails, or its answer can't be understood.
     */
    std::vector<RegistryImage> listImageTags(const std::string& repository, ImageBranch branch = ImageBranch::Stable);

    /**
     * @brief Like listImageTags(), restricted to tags built during the last days
     */
    std::vector<RegistryImage> getRecentImages(const std::string& repository, int days = RECENT_DAYS,
                                               ImageBranch branch = ImageBranch::Stable, time_t now = time(nullptr));

    static std::vector<RegistryImage> parseTags(const std::string& repository, const std::string& json,
                                                ImageBranch branch);
    static bool matchesBranch(const std::string& tag, ImageBranch branch);
    static std::optional<time_t> parseTagDate(const std::string& tag);

    /**
     * @brief Repository of a deployment origin, e.g. "ghcr.io/ublue-os/bluefin-dx" for
     * "ostree-unverified-registry:ghcr.io/ublue-os/bluefin-dx:stable"
     */
    static std::string repositoryFromOrigin(const std::string& origin);
private:
    void checkRepository(const std::string& repository) const;

    ProcessSpawner& spawner;
    RegistryAllowList allowList;
};

} // namespace RebaseKit

#endif // R_K_REGISTRYBROWSER_H
