#include "buildmeta/BuildMetaCli.hpp"

#include <iostream>
#include <string>

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "build/build_identity.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace kgnav {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitIoError = 1;
constexpr int kExitUsage = 2;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  kgnav-buildmeta [--json] [--output PATH] [--minutes N]\n"
        "\n"
        "Prints BUILD_MINUTES, BUILD_NUMBER, BUILD_EPOCH and BUILD_ISO for the\n"
        "current minute. When GITHUB_ENV is set the same lines are appended to it.\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QStringList envLines(const BuildInfo &info)
{
    return {
        QStringLiteral("BUILD_MINUTES=%1").arg(info.epochMinutes),
        QStringLiteral("BUILD_NUMBER=%1").arg(QString::fromStdString(info.buildNumber)),
        QStringLiteral("BUILD_EPOCH=%1").arg(info.epochSeconds),
        QStringLiteral("BUILD_ISO=%1").arg(QString::fromStdString(info.builtAtIso)),
    };
}

void logIoFailure(const QString &what, const QString &path)
{
    KGNAV_LOG_ERROR(QStringLiteral("BuildMetaCli"),
                    QStringLiteral("run"),
                    what,
                    QStringLiteral("io_error"),
                    QStringLiteral("qfile"),
                    kgnav::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"path", path.toStdString()}}));
}

} // namespace

int BuildMetaCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.contains(QStringLiteral("--help")) || args.contains(QStringLiteral("-h"))) {
        std::cout << usageText().toStdString();
        return kExitOk;
    }

    std::uint64_t minutes = currentEpochMinutes();
    if (args.contains(QStringLiteral("--minutes"))) {
        const auto parsed =
            parseEpochMinutes(getArgValue(args, QStringLiteral("--minutes")).toStdString());
        if (!parsed) {
            std::cerr << "Invalid --minutes value." << std::endl;
            std::cerr << usageText().toStdString();
            return kExitUsage;
        }
        minutes = *parsed;
    }

    const BuildInfo info = makeBuildInfo(std::to_string(minutes), std::string(), std::string());
    const QStringList lines = envLines(info);

    KGNAV_LOG_INFO(QStringLiteral("BuildMetaCli"),
                   QStringLiteral("run"),
                   QStringLiteral("build_metadata_computed"),
                   QStringLiteral("user_invocation"),
                   QStringLiteral("cli"),
                   kgnav::logging::defaultWho(),
                   QString(),
                   toBuildMetadataJson(info));

    if (args.contains(QStringLiteral("--json"))) {
        std::cout << toBuildMetadataJson(info).dump(2) << std::endl;
    } else {
        std::cout << lines.join('\n').toStdString() << std::endl;
    }

    // A trailing --output without a path writes nothing.
    const QString outputPath = getArgValue(args, QStringLiteral("--output"));
    if (!outputPath.isEmpty() && !writeOutputFile(outputPath, info)) {
        std::cerr << "Failed to write " << outputPath.toStdString() << std::endl;
        logIoFailure(QStringLiteral("output_write_failed"), outputPath);
        return kExitIoError;
    }

    const QString githubEnv = qEnvironmentVariable("GITHUB_ENV");
    if (!githubEnv.isEmpty() && !appendGithubEnv(githubEnv, lines)) {
        std::cerr << "Failed to append to GITHUB_ENV." << std::endl;
        logIoFailure(QStringLiteral("github_env_append_failed"), githubEnv);
        return kExitIoError;
    }

    return kExitOk;
}

bool BuildMetaCli::writeOutputFile(const QString &path, const BuildInfo &info) const
{
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return false;
    }
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        return false;
    }
    const QByteArray data = QByteArray::fromStdString(toBuildMetadataJson(info).dump(2)) + '\n';
    return file.write(data) == data.size();
}

bool BuildMetaCli::appendGithubEnv(const QString &path, const QStringList &lines) const
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return false;
    }
    const QByteArray data = lines.join('\n').toUtf8() + '\n';
    return file.write(data) == data.size();
}

std::uint64_t BuildMetaCli::currentEpochMinutes() const
{
    return static_cast<std::uint64_t>(QDateTime::currentSecsSinceEpoch() / 60);
}

} // namespace kgnav
