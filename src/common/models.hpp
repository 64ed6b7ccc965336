#pragma once

#include <cstdint>
#include <string>

namespace kgnav {

struct BuildInfo {
    std::uint64_t epochMinutes = 0;
    std::string buildNumber = "00000";
    std::uint64_t epochSeconds = 0;
    std::string semver;
    std::string gitSha = "unknown";
    std::string builtAtIso;
    std::string versionBuild;
};

} // namespace kgnav
