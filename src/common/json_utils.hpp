#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace kgnav {

// Wire format of the build-info query. Field names are consumed by the
// front-end and must not change; the two epoch values travel as decimal
// strings.
inline void to_json(nlohmann::json &j, const BuildInfo &info)
{
    j = nlohmann::json{
        {"buildNumber", info.buildNumber},
        {"epochMinutes", std::to_string(info.epochMinutes)},
        {"epoch", std::to_string(info.epochSeconds)},
        {"semver", info.semver},
        {"gitSha", info.gitSha},
        {"builtAtIso", info.builtAtIso},
        {"versionBuild", info.versionBuild}
    };
}

// Build-metadata document written by kgnav-buildmeta. Unlike the query
// payload the numbers stay numeric here.
inline nlohmann::json toBuildMetadataJson(const BuildInfo &info)
{
    return nlohmann::json{
        {"epochMinutes", info.epochMinutes},
        {"buildNumber", info.buildNumber},
        {"epochSeconds", info.epochSeconds},
        {"builtAtIso", info.builtAtIso}
    };
}

} // namespace kgnav
