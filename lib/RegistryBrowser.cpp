/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Listing the tags of allow-listed image repositories with skopeo
 */

#include "RegistryBrowser.hpp"
#include "Exceptions.hpp"
#include "Log.hpp"
#include "ProcessSpawner.hpp"
#include "Util.hpp"
#include <algorithm>
#include <json/json.h>
#include <regex>
#include <sstream>
#include <utility>

namespace RebaseKit {

namespace {

constexpr time_t SECONDS_PER_DAY = 24 * 60 * 60;

} // namespace

const char* toString(ImageBranch branch) {
    switch (branch) {
    case ImageBranch::Stable:
        return "stable";
    case ImageBranch::Testing:
        return "testing";
    case ImageBranch::All:
        return "all";
    }
    return "unknown";
}

std::optional<ImageBranch> imageBranchFromString(const std::string& name) {
    if (name == "stable")
        return ImageBranch::Stable;
    if (name == "testing")
        return ImageBranch::Testing;
    if (name == "all")
        return ImageBranch::All;
    return std::nullopt;
}

std::string RegistryImage::reference() const {
    return repository + ":" + tag;
}

std::string RegistryImage::formattedDate() const {
    if (!date)
        return "Unknown";
    struct tm tm;
    char buffer[16];
    if (gmtime_r(&*date, &tm) == nullptr || strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm) == 0)
        return "Unknown";
    return buffer;
}

std::optional<long> RegistryImage::ageDays(time_t now) const {
    if (!date)
        return std::nullopt;
    return static_cast<long>((now - *date) / SECONDS_PER_DAY);
}

RegistryBrowser::RegistryBrowser(ProcessSpawner& spawner, RegistryAllowList allowList)
    : spawner{spawner}, allowList{std::move(allowList)} {
}

bool RegistryBrowser::isAvailable() {
    try {
        int ret = spawner.spawn({PROGRAM, "--version"}, [](const std::string& line) { rklog.debug(line); });
        return ret == 0;
    } catch (const ExecutionException &e) {
        rklog.debug(e.what());
        return false;
    }
}

void RegistryBrowser::checkRepository(const std::string& repository) const {
    static const std::regex hostExp("[a-z0-9]+(?:[.-][a-z0-9]+)*(?::[0-9]+)?");
    static const std::regex pathExp("[a-z0-9]+(?:[._-][a-z0-9]+)*(?:/[a-z0-9]+(?:[._-][a-z0-9]+)*)*");

    size_t slash = repository.find('/');
    if (slash != std::string::npos) {
        std::string host = repository.substr(0, slash);
        std::string path = repository.substr(slash + 1);
        if (std::regex_match(host, hostExp) && std::regex_match(path, pathExp) &&
            allowList.isPathAllowed(host, path))
            return;
    }
    throw RegistryException{RegistryError::RepositoryNotAllowed,
        "Repository '" + repository + "' is not allowed; allowed registries: " +
        Util::join(allowList.registries(), ", ") + "."};
}

std::vector<RegistryImage> RegistryBrowser::listImageTags(const std::string& repository, ImageBranch branch) {
    checkRepository(repository);

    std::vector<std::string> output;
    int ret;
    try {
        ret = spawner.spawn({PROGRAM, "list-tags", "docker://" + repository},
                            [&output](const std::string& line) { output.push_back(line); });
    } catch (const ExecutionException &e) {
        throw RegistryException{RegistryError::ToolUnavailable,
            std::string{"Listing image tags requires skopeo: "} + e.what()};
    }
    if (ret != 0) {
        std::string reason = output.empty() ? std::string{"."} : ": " + output.back();
        throw RegistryException{RegistryError::QueryFailed,
            "Querying " + repository + " failed with exit status " + std::to_string(ret) + reason};
    }

    // Warnings on stderr precede the JSON document
    auto start = std::find_if(output.begin(), output.end(), [](const std::string& line) {
        return !line.empty() && line.front() == '{';
    });
    std::vector<std::string> document{start, output.end()};
    std::vector<RegistryImage> images = parseTags(repository, Util::join(document, "\n"), branch);
    rklog.debug("Found ", images.size(), " ", toString(branch), " tag(s) for ", repository, ".");
    return images;
}

std::vector<RegistryImage> RegistryBrowser::getRecentImages(const std::string& repository, int days,
                                                            ImageBranch branch, time_t now) {
    time_t cutoff = now - static_cast<time_t>(days) * SECONDS_PER_DAY;
    std::vector<RegistryImage> recent;
    for (auto& image: listImageTags(repository, branch)) {
        if (image.date) {
            if (*image.date >= cutoff)
                recent.push_back(image);
        } else if (recent.size() < MAX_UNDATED) {
            recent.push_back(image);
        }
    }
    return recent;
}

std::vector<RegistryImage> RegistryBrowser::parseTags(const std::string& repository, const std::string& json,
                                                      ImageBranch branch) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream in{json};
    try {
        if (!Json::parseFromStream(builder, in, &root, &errors))
            throw RegistryException{RegistryError::InvalidResponse, "Could not parse tag list: " + errors};
    } catch (const Json::Exception &e) {
        throw RegistryException{RegistryError::InvalidResponse, std::string{"Could not parse tag list: "} + e.what()};
    }
    if (!root.isObject() || !root["Tags"].isArray())
        throw RegistryException{RegistryError::InvalidResponse, "Tag list of " + repository + " contains no tags."};

    std::vector<RegistryImage> images;
    for (auto& value: root["Tags"]) {
        if (!value.isString())
            continue;
        std::string tag = value.asString();
        if (!matchesBranch(tag, branch))
            continue;
        images.push_back({repository, tag, parseTagDate(tag)});
    }
    std::stable_sort(images.begin(), images.end(), [](const RegistryImage& a, const RegistryImage& b) {
        if (a.date && b.date)
            return *a.date > *b.date;
        return a.date.has_value() && !b.date.has_value();
    });
    return images;
}

bool RegistryBrowser::matchesBranch(const std::string& tag, ImageBranch branch) {
    static const std::regex stableExp("[0-9]+-stable.*");
    static const std::regex testingExp("[0-9]+-testing.*");
    switch (branch) {
    case ImageBranch::Stable:
        return Util::startsWith(tag, "stable") || std::regex_match(tag, stableExp);
    case ImageBranch::Testing:
        return Util::startsWith(tag, "testing") || std::regex_match(tag, testingExp);
    case ImageBranch::All:
        return true;
    }
    return false;
}

std::optional<time_t> RegistryBrowser::parseTagDate(const std::string& tag) {
    static const std::regex dateExp("([0-9]{4})([0-9]{2})([0-9]{2})");
    std::smatch match;
    if (!std::regex_search(tag, match, dateExp))
        return std::nullopt;

    int year = std::stoi(match[1].str()) - 1900;
    int month = std::stoi(match[2].str()) - 1;
    int day = std::stoi(match[3].str());
    struct tm tm = {};
    tm.tm_year = year;
    tm.tm_mon = month;
    tm.tm_mday = day;
    // timegm normalizes invalid dates such as 20240231; reject them
    time_t date = timegm(&tm);
    if (date == -1 || tm.tm_year != year || tm.tm_mon != month || tm.tm_mday != day)
        return std::nullopt;
    return date;
}

std::string RegistryBrowser::repositoryFromOrigin(const std::string& origin) {
    std::string ref = origin;
    size_t scheme = ref.find("://");
    if (scheme != std::string::npos)
        ref.erase(0, scheme + 3);

    // Drop transport prefixes like "ostree-unverified-registry:" or "ostree-remote-registry:<remote>:";
    // a registry host contains a dot or is localhost
    while (true) {
        size_t colon = ref.find(':');
        size_t slash = ref.find('/');
        if (colon == std::string::npos || (slash != std::string::npos && colon > slash))
            break;
        std::string prefix = ref.substr(0, colon);
        if (prefix.find('.') != std::string::npos || prefix == "localhost")
            break;
        ref.erase(0, colon + 1);
    }

    size_t at = ref.find('@');
    if (at != std::string::npos)
        ref.erase(at);
    size_t lastSlash = ref.rfind('/');
    size_t tag = ref.find(':', lastSlash == std::string::npos ? 0 : lastSlash);
    if (tag != std::string::npos)
        ref.erase(tag);
    return ref;
}

} // namespace RebaseKit
