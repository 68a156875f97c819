/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Permitted image registries and, per registry, the permitted repository
  path prefixes.
 */

#ifndef R_K_REGISTRYALLOWLIST_H
#define R_K_REGISTRYALLOWLIST_H

#include <map>
#include <string>
#include <vector>

namespace RebaseKit {

class Configuration;

class RegistryAllowList {
public:
    RegistryAllowList() = default;

    /**
     * @brief Construct from "host/path/prefix" entries
     * @param images e.g. {"ghcr.io/ublue-os/bluefin", "quay.io/fedora/fedora-silverblue"}
     */
    explicit RegistryAllowList(const std::vector<std::string>& images);

    /**
     * @brief Built-in list of Universal Blue and Fedora atomic desktop images
     */
    static RegistryAllowList defaults();

    /**
     * @brief Read the ALLOWED_IMAGE[...] keys; falls back to defaults() if none are set.
     */
    static RegistryAllowList fromConfig(Configuration& configuration);

    void allow(const std::string& image);
    bool hasRegistry(const std::string& host) const;

    /**
     * @brief A path is permitted if it equals a prefix or continues it with a "-variant" suffix,
     * i.e. "ublue-os/bluefin" permits "ublue-os/bluefin-dx", but not "ublue-os/bluefinx".
     */
    bool isPathAllowed(const std::string& host, const std::string& path) const;
    std::vector<std::string> permittedPaths(const std::string& host) const;
    std::vector<std::string> registries() const;
    bool empty() const { return rules.empty(); }
private:
    std::map<std::string, std::vector<std::string>> rules;
};

} // namespace RebaseKit

#endif // R_K_REGISTRYALLOWLIST_H
