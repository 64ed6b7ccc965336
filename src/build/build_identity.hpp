#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "common/models.hpp"

namespace kgnav {

constexpr std::size_t kBuildNumberWidth = 5;

// Base-36 encoding of epoch minutes, cut to the 5 least-significant digits
// and zero-padded on the left. Total for every input.
std::string encodeBuildNumber(std::uint64_t epochMinutes);

// Keeps the last 5 characters of a digit sequence and left-pads it with '0'.
std::string padBuildNumber(const std::string &digits);

// Accepts a run of decimal digits (surrounding whitespace ignored) that fits
// in 64 bits.
std::optional<std::uint64_t> parseEpochMinutes(const std::string &raw);

// Encoding of the parsed value, or "00000" when raw is not a valid count.
std::string buildNumberFromRaw(const std::string &raw);

// minutes * 60, clamped to UINT64_MAX.
std::uint64_t epochSecondsFromMinutes(std::uint64_t epochMinutes);

// First non-empty candidate, else "unknown".
std::string resolveRevision(const std::optional<std::string> &primary,
                            const std::optional<std::string> &secondary);

// "v<major>.<minor:02><bucket:04>", bucket = (epochSeconds / 100) % 10000.
std::string computeVersionBuild(const std::string &semver, std::uint64_t epochSeconds);

std::string formatBuiltAtIso(std::uint64_t epochSeconds);

BuildInfo makeBuildInfo(const std::string &rawEpochMinutes,
                        const std::string &semver,
                        const std::string &gitSha);

// Record baked into this binary at configure time. Built on first use and
// immutable afterwards.
const BuildInfo &currentBuildInfo();

} // namespace kgnav
