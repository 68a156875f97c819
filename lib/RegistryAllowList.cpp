/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Permitted image registries and repository path prefixes
 */

#include "RegistryAllowList.hpp"
#include "Configuration.hpp"
#include "Log.hpp"
#include "Util.hpp"
#include <algorithm>
#include <stdexcept>

namespace RebaseKit {

RegistryAllowList::RegistryAllowList(const std::vector<std::string>& images) {
    for (auto& image: images) {
        allow(image);
    }
}

RegistryAllowList RegistryAllowList::defaults() {
    return RegistryAllowList{{
        "ghcr.io/ublue-os/aurora",
        "ghcr.io/ublue-os/base-main",
        "ghcr.io/ublue-os/bazzite",
        "ghcr.io/ublue-os/bluefin",
        "ghcr.io/ublue-os/kinoite-main",
        "ghcr.io/ublue-os/silverblue-main",
        "ghcr.io/ublue-os/ucore",
        "quay.io/fedora/fedora-kinoite",
        "quay.io/fedora/fedora-silverblue",
        "quay.io/fedora-ostree-desktops/kinoite",
        "quay.io/fedora-ostree-desktops/onyx",
        "quay.io/fedora-ostree-desktops/sericea",
        "quay.io/fedora-ostree-desktops/silverblue",
        "registry.fedoraproject.org/fedora/fedora-silverblue",
    }};
}

RegistryAllowList RegistryAllowList::fromConfig(Configuration& configuration) {
    std::vector<std::string> images = configuration.getArray("ALLOWED_IMAGE");
    if (images.empty()) {
        rklog.debug("No ALLOWED_IMAGE entries configured, using built-in registry allow-list.");
        return defaults();
    }
    return RegistryAllowList{images};
}

void RegistryAllowList::allow(const std::string& image) {
    std::string entry = image;
    Util::trim(entry);
    while (!entry.empty() && entry.back() == '/')
        entry.pop_back();

    size_t slash = entry.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= entry.size())
        throw std::invalid_argument{"Invalid allow-list entry '" + image + "', expected <registry>/<path>."};

    std::string host = Util::toLower(entry.substr(0, slash));
    std::string path = entry.substr(slash + 1);
    auto& paths = rules[host];
    if (std::find(paths.begin(), paths.end(), path) == paths.end())
        paths.push_back(path);
}

bool RegistryAllowList::hasRegistry(const std::string& host) const {
    return rules.count(Util::toLower(host)) != 0;
}

bool RegistryAllowList::isPathAllowed(const std::string& host, const std::string& path) const {
    auto rule = rules.find(Util::toLower(host));
    if (rule == rules.end())
        return false;
    return std::any_of(rule->second.begin(), rule->second.end(), [&path](const std::string& prefix) {
        return path == prefix || Util::startsWith(path, prefix + "-");
    });
}

std::vector<std::string> RegistryAllowList::permittedPaths(const std::string& host) const {
    auto rule = rules.find(Util::toLower(host));
    if (rule == rules.end())
        return {};
    std::vector<std::string> paths = rule->second;
    std::sort(paths.begin(), paths.end());
    return paths;
}

std::vector<std::string> RegistryAllowList::registries() const {
    std::vector<std::string> hosts;
    for (auto& rule: rules) {
        hosts.push_back(rule.first);
    }
    return hosts;
}

} // namespace RebaseKit
