#include <QApplication>
#include <QCommandLineParser>
#include <QQuickStyle>
#include <QUrl>

#include <cstdlib>

#include "build/build_identity.hpp"
#include "common/logging.hpp"
#include "ui/ShellWindow.hpp"
#include "ui/backend/ShellBridge.hpp"

#ifdef KGNAV_HAS_NATIVE_MENU
#include "menu/menu_router.hpp"
#endif

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("kgnav"));
    QCoreApplication::setApplicationVersion(QStringLiteral(KGNAV_VERSION));

    if (qEnvironmentVariableIsEmpty("QT_QUICK_CONTROLS_STYLE")) {
        QQuickStyle::setStyle(QStringLiteral("Fusion"));
    }

    QCommandLineParser parser;
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Enable verbose trace logging.");
    QCommandLineOption frontendOption(QStringList() << "frontend",
                                      "Load the front-end from this QML file.",
                                      "path");
    parser.addOption(traceOption);
    parser.addOption(frontendOption);
    parser.process(app);

    const bool trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("KGNAV_TRACE") == 1;
    kgnav::logging::initLogging(QStringLiteral("kgnav"), trace);

    // Build metadata is settled before the event loop; it is read-only after.
    const kgnav::BuildInfo &buildInfo = kgnav::currentBuildInfo();
    KGNAV_LOG_INFO(QStringLiteral("main"),
                   QStringLiteral("main"),
                   QStringLiteral("shell_start"),
                   QStringLiteral("user_start"),
                   QStringLiteral("qt_app"),
                   kgnav::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"buildNumber", buildInfo.buildNumber},
                                   {"semver", buildInfo.semver},
                                   {"gitSha", buildInfo.gitSha}}));

    kgnav::ShellBridge bridge(buildInfo);

#ifdef KGNAV_HAS_NATIVE_MENU
    kgnav::MenuEventRouter router(bridge);
#endif

    kgnav::ShellWindow window(bridge);

#ifdef KGNAV_HAS_NATIVE_MENU
    if (!router.attachTo(window.menuBar())) {
        return EXIT_FAILURE;
    }
#endif

    const QUrl source = parser.isSet(frontendOption)
        ? QUrl::fromLocalFile(parser.value(frontendOption))
        : QUrl::fromLocalFile(QStringLiteral(KGNAV_QML_DIR "/Main.qml"));
    if (!window.loadFrontend(source)) {
        return EXIT_FAILURE;
    }

    window.show();
    return app.exec();
}
