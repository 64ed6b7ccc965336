#include <QtTest/QtTest>

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <iostream>
#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>

#include "buildmeta/BuildMetaCli.hpp"

class BuildMetaCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testEnvLines();
    void testJsonOutput();
    void testOutputFileCreatesDirectories();
    void testGithubEnvAppend();
    void testInvalidMinutesIsUsageError();
    void testTrailingOutputWithoutPathSkipsWrite();
    void testClockDefault();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QByteArray m_prevGithubEnv;

    int runCli(const QStringList &args, std::string &out);
};

void BuildMetaCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    m_prevGithubEnv = qgetenv("GITHUB_ENV");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void BuildMetaCliTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
    if (m_prevGithubEnv.isEmpty()) {
        qunsetenv("GITHUB_ENV");
    } else {
        qputenv("GITHUB_ENV", m_prevGithubEnv);
    }
}

void BuildMetaCliTests::init()
{
    qunsetenv("GITHUB_ENV");
}

int BuildMetaCliTests::runCli(const QStringList &args, std::string &out)
{
    std::stringstream buffer;
    std::stringstream errors;
    auto *oldBuf = std::cout.rdbuf(buffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(errors.rdbuf());

    kgnav::BuildMetaCli cli;
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : args) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }

    const int result = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    std::cout.rdbuf(oldBuf);
    std::cerr.rdbuf(oldErr);
    out = buffer.str();
    return result;
}

void BuildMetaCliTests::testEnvLines()
{
    std::string output;
    const int code = runCli({"kgnav-buildmeta", "--minutes", "28401120"}, output);
    QCOMPARE(code, 0);
    QCOMPARE(QString::fromStdString(output),
             QStringLiteral("BUILD_MINUTES=28401120\n"
                            "BUILD_NUMBER=GWQG0\n"
                            "BUILD_EPOCH=1704067200\n"
                            "BUILD_ISO=2024-01-01T00:00:00.000Z\n"));
}

void BuildMetaCliTests::testJsonOutput()
{
    std::string output;
    const int code = runCli({"kgnav-buildmeta", "--json", "--minutes", "36"}, output);
    QCOMPARE(code, 0);

    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(parsed.at("epochMinutes").get<std::uint64_t>(), std::uint64_t(36));
    QCOMPARE(QString::fromStdString(parsed.at("buildNumber").get<std::string>()),
             QStringLiteral("00010"));
    QCOMPARE(parsed.at("epochSeconds").get<std::uint64_t>(), std::uint64_t(2160));
}

void BuildMetaCliTests::testOutputFileCreatesDirectories()
{
    const QString path = m_tempDir.path() + "/nested/dir/build-meta.json";
    std::string output;
    const int code = runCli({"kgnav-buildmeta", "--minutes", "0", "--output", path}, output);
    QCOMPARE(code, 0);

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto parsed = nlohmann::json::parse(file.readAll().toStdString());
    QCOMPARE(QString::fromStdString(parsed.at("buildNumber").get<std::string>()),
             QStringLiteral("00000"));
    QCOMPARE(QString::fromStdString(parsed.at("builtAtIso").get<std::string>()),
             QStringLiteral("1970-01-01T00:00:00.000Z"));
}

void BuildMetaCliTests::testGithubEnvAppend()
{
    const QString path = m_tempDir.path() + "/github_env";
    QFile seed(path);
    QVERIFY(seed.open(QIODevice::WriteOnly | QIODevice::Truncate));
    seed.write("EXISTING=1\n");
    seed.close();
    qputenv("GITHUB_ENV", path.toUtf8());

    std::string output;
    const int code = runCli({"kgnav-buildmeta", "--json", "--minutes", "35"}, output);
    QCOMPARE(code, 0);

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QStringList lines = QString::fromUtf8(file.readAll()).split('\n', Qt::SkipEmptyParts);
    QCOMPARE(lines.size(), 5);
    QCOMPARE(lines.at(0), QStringLiteral("EXISTING=1"));
    QCOMPARE(lines.at(1), QStringLiteral("BUILD_MINUTES=35"));
    QCOMPARE(lines.at(2), QStringLiteral("BUILD_NUMBER=0000Z"));
    QCOMPARE(lines.at(3), QStringLiteral("BUILD_EPOCH=2100"));
}

void BuildMetaCliTests::testInvalidMinutesIsUsageError()
{
    std::string output;
    QCOMPARE(runCli({"kgnav-buildmeta", "--minutes", "soon"}, output), 2);
    QCOMPARE(runCli({"kgnav-buildmeta", "--minutes"}, output), 2);
    QVERIFY(output.empty());
}

void BuildMetaCliTests::testTrailingOutputWithoutPathSkipsWrite()
{
    const QStringList before = QDir(m_tempDir.path()).entryList(QDir::Files);

    std::string output;
    QCOMPARE(runCli({"kgnav-buildmeta", "--minutes", "36", "--output"}, output), 0);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("BUILD_NUMBER=00010")));
    QCOMPARE(QDir(m_tempDir.path()).entryList(QDir::Files), before);
}

void BuildMetaCliTests::testClockDefault()
{
    const qint64 before = QDateTime::currentSecsSinceEpoch() / 60;
    std::string output;
    QCOMPARE(runCli({"kgnav-buildmeta", "--json"}, output), 0);
    const qint64 after = QDateTime::currentSecsSinceEpoch() / 60;

    const auto parsed = nlohmann::json::parse(output);
    const auto minutes = static_cast<qint64>(parsed.at("epochMinutes").get<std::uint64_t>());
    QVERIFY(minutes >= before);
    QVERIFY(minutes <= after);
    QCOMPARE(parsed.at("epochSeconds").get<std::uint64_t>() % 60, std::uint64_t(0));
}

QTEST_MAIN(BuildMetaCliTests)
#include "test_buildmeta_cli.moc"
