#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "build/build_identity.hpp"
#include "common/json_utils.hpp"

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testBuildInfoWireFields();
    void testEpochValuesAreDecimalStrings();
    void testDefaultBuildInfo();
    void testBuildMetadataDocument();
};

void ModelsJsonTests::testBuildInfoWireFields()
{
    const kgnav::BuildInfo info = kgnav::makeBuildInfo("28401120", "1.2.3", "abc123");
    const nlohmann::json j = info;

    QVERIFY(j.is_object());
    for (const char *key : {"buildNumber", "epochMinutes", "epoch", "semver", "gitSha",
                            "builtAtIso", "versionBuild"}) {
        QVERIFY2(j.contains(key), key);
    }
    QCOMPARE(j.size(), static_cast<size_t>(7));
    QCOMPARE(QString::fromStdString(j.at("buildNumber").get<std::string>()), QStringLiteral("GWQG0"));
    QCOMPARE(QString::fromStdString(j.at("semver").get<std::string>()), QStringLiteral("1.2.3"));
    QCOMPARE(QString::fromStdString(j.at("gitSha").get<std::string>()), QStringLiteral("abc123"));
}

void ModelsJsonTests::testEpochValuesAreDecimalStrings()
{
    const kgnav::BuildInfo info = kgnav::makeBuildInfo("28401120", "1.2.3", "abc123");
    const nlohmann::json j = info;

    QVERIFY(j.at("epochMinutes").is_string());
    QVERIFY(j.at("epoch").is_string());
    QCOMPARE(QString::fromStdString(j.at("epochMinutes").get<std::string>()),
             QStringLiteral("28401120"));
    QCOMPARE(QString::fromStdString(j.at("epoch").get<std::string>()),
             QStringLiteral("1704067200"));
}

void ModelsJsonTests::testDefaultBuildInfo()
{
    const kgnav::BuildInfo info;
    const nlohmann::json j = info;

    QCOMPARE(QString::fromStdString(j.value("buildNumber", "")), QStringLiteral("00000"));
    QCOMPARE(QString::fromStdString(j.value("gitSha", "")), QStringLiteral("unknown"));
    QCOMPARE(QString::fromStdString(j.value("epoch", "")), QStringLiteral("0"));
}

void ModelsJsonTests::testBuildMetadataDocument()
{
    const kgnav::BuildInfo info = kgnav::makeBuildInfo("36", "", "");
    const nlohmann::json j = kgnav::toBuildMetadataJson(info);

    QCOMPARE(j.size(), static_cast<size_t>(4));
    QVERIFY(j.at("epochMinutes").is_number_unsigned());
    QCOMPARE(j.at("epochMinutes").get<std::uint64_t>(), std::uint64_t(36));
    QCOMPARE(j.at("epochSeconds").get<std::uint64_t>(), std::uint64_t(2160));
    QCOMPARE(QString::fromStdString(j.at("buildNumber").get<std::string>()), QStringLiteral("00010"));
    QCOMPARE(QString::fromStdString(j.at("builtAtIso").get<std::string>()),
             QStringLiteral("1970-01-01T00:36:00.000Z"));
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
