#include "build/build_identity.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

#ifndef KGNAV_BUILD_MINUTES
#define KGNAV_BUILD_MINUTES "0"
#endif

#ifndef KGNAV_VERSION
#define KGNAV_VERSION "0.0.0-dev"
#endif

#ifndef KGNAV_GIT_SHA
#define KGNAV_GIT_SHA "unknown"
#endif

namespace kgnav {

namespace {

constexpr std::uint64_t kRadix = 36;
constexpr char kDigits[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr const char *kUnknownRevision = "unknown";
constexpr const char *kDevVersion = "0.0.0-dev";

std::string trimmed(const std::string &value)
{
    const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(value.begin(), value.end(), isSpace);
    auto end = std::find_if_not(value.rbegin(), value.rend(), isSpace).base();
    if (begin >= end) {
        return std::string();
    }
    return std::string(begin, end);
}

// Leading decimal digits of a version component; "3-rc1" reads as 3.
unsigned leadingNumber(const std::string &part)
{
    unsigned value = 0;
    for (const char c : part) {
        if (c < '0' || c > '9') {
            break;
        }
        if (value > (std::numeric_limits<unsigned>::max() - 9) / 10) {
            break;
        }
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    return value;
}

} // namespace

std::string encodeBuildNumber(std::uint64_t epochMinutes)
{
    std::string digits;
    if (epochMinutes == 0) {
        digits = "0";
    }
    while (epochMinutes > 0) {
        digits.insert(digits.begin(), kDigits[epochMinutes % kRadix]);
        epochMinutes /= kRadix;
    }
    return padBuildNumber(digits);
}

std::string padBuildNumber(const std::string &digits)
{
    if (digits.size() > kBuildNumberWidth) {
        return digits.substr(digits.size() - kBuildNumberWidth);
    }
    return std::string(kBuildNumberWidth - digits.size(), '0') + digits;
}

std::optional<std::uint64_t> parseEpochMinutes(const std::string &raw)
{
    const std::string value = trimmed(raw);
    if (value.empty()) {
        return std::nullopt;
    }

    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t result = 0;
    for (const char c : value) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (result > (kMax - digit) / 10) {
            return std::nullopt;
        }
        result = result * 10 + digit;
    }
    return result;
}

std::string buildNumberFromRaw(const std::string &raw)
{
    const auto minutes = parseEpochMinutes(raw);
    if (!minutes) {
        return std::string(kBuildNumberWidth, '0');
    }
    return encodeBuildNumber(*minutes);
}

std::uint64_t epochSecondsFromMinutes(std::uint64_t epochMinutes)
{
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    if (epochMinutes > kMax / 60) {
        return kMax;
    }
    return epochMinutes * 60;
}

std::string resolveRevision(const std::optional<std::string> &primary,
                            const std::optional<std::string> &secondary)
{
    if (primary && !primary->empty()) {
        return *primary;
    }
    if (secondary && !secondary->empty()) {
        return *secondary;
    }
    return kUnknownRevision;
}

std::string computeVersionBuild(const std::string &semver, std::uint64_t epochSeconds)
{
    std::string majorPart;
    std::string minorPart;
    std::istringstream parts(semver);
    std::getline(parts, majorPart, '.');
    std::getline(parts, minorPart, '.');

    const std::uint64_t bucket = (epochSeconds / 100) % 10000;

    std::ostringstream out;
    out << 'v' << leadingNumber(majorPart) << '.'
        << std::setw(2) << std::setfill('0') << leadingNumber(minorPart)
        << std::setw(4) << std::setfill('0') << bucket;
    return out.str();
}

std::string formatBuiltAtIso(std::uint64_t epochSeconds)
{
    if (epochSeconds > static_cast<std::uint64_t>(std::numeric_limits<std::time_t>::max())) {
        return std::string();
    }
    const auto time = static_cast<std::time_t>(epochSeconds);
    std::tm tm{};
    if (gmtime_r(&time, &tm) == nullptr) {
        return std::string();
    }
    std::ostringstream out;
    // Whole seconds only; the fraction is fixed at .000.
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << ".000Z";
    return out.str();
}

BuildInfo makeBuildInfo(const std::string &rawEpochMinutes,
                        const std::string &semver,
                        const std::string &gitSha)
{
    BuildInfo info;
    info.epochMinutes = parseEpochMinutes(rawEpochMinutes).value_or(0);
    info.buildNumber = buildNumberFromRaw(rawEpochMinutes);
    info.epochSeconds = epochSecondsFromMinutes(info.epochMinutes);
    info.semver = semver.empty() ? kDevVersion : semver;
    info.gitSha = resolveRevision(gitSha, std::nullopt);
    info.builtAtIso = formatBuiltAtIso(info.epochSeconds);
    info.versionBuild = computeVersionBuild(info.semver, info.epochSeconds);
    return info;
}

const BuildInfo &currentBuildInfo()
{
    static const BuildInfo info =
        makeBuildInfo(KGNAV_BUILD_MINUTES, KGNAV_VERSION, KGNAV_GIT_SHA);
    return info;
}

} // namespace kgnav
