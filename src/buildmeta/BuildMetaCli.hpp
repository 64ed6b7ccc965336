#pragma once

#include <cstdint>

#include <QString>
#include <QStringList>

#include "common/models.hpp"

namespace kgnav {

class BuildMetaCli
{
public:
    // Prints build metadata for the current minute (or --minutes N).
    // returns exit code
    int run(int argc, char *argv[]);

private:
    bool writeOutputFile(const QString &path, const BuildInfo &info) const;
    bool appendGithubEnv(const QString &path, const QStringList &lines) const;
    std::uint64_t currentEpochMinutes() const;
};

} // namespace kgnav
